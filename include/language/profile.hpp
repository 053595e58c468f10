#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 包管理器类型，决定依赖安装脚本和缓存的产物目录
 */
enum class package_manager {
    NONE,
    NPM,
    PIP,
    MAVEN,
    CONAN
};

const char *get_display_message(package_manager manager);

/**
 * @brief 自定义库合并进工作目录的方式
 */
enum class library_kind {
    /**
     * @brief npm 包归档（.tgz/.tar.gz），解压到 node_modules/<包名>
     */
    NPM_PACKAGE,

    /**
     * @brief Java 库，复制到 lib/
     */
    JAR,

    /**
     * @brief Python wheel 或源码包，pip install --user 安装
     */
    PYTHON_PACKAGE,

    /**
     * @brief 动态库或静态库，复制到 lib/
     */
    NATIVE_LIBRARY,

    /**
     * @brief 头文件，复制到 include/
     */
    NATIVE_HEADER,

    /**
     * @brief 包含库和头文件的归档（.tar.gz/.tgz/.zip）
     */
    NATIVE_ARCHIVE,

    UNKNOWN
};

/**
 * @brief 库文件规则：小写文件名匹配 pattern 时视为 kind 类型的库
 */
struct library_rule {
    std::regex pattern;
    library_kind kind;
};

/**
 * @brief 描述一种语言的运行环境
 */
struct language_profile {
    /**
     * @brief 规范的语言名，比如 "python"、"javascript"
     * 同时也是依赖缓存卷名的一部分
     */
    std::string name;

    /**
     * @brief 运行这种语言的容器镜像
     */
    std::string image;

    /**
     * @brief 默认的入口文件名，只提交了 code 时，代码将被保存为这个文件
     */
    std::string entry_file;

    /**
     * @brief 可以识别的源代码扩展名（包括点），编译型语言会将这些文件全部传给编译器
     */
    std::vector<std::string> source_extensions;

    /**
     * @brief 依赖清单文件名，存在其中之一时需要安装依赖
     */
    std::vector<std::string> manifest_files;

    package_manager manager = package_manager::NONE;

    bool compiled = false;

    /**
     * @brief 编译并运行的命令模板，交给 sh -c 执行
     * 可用的占位符：
     *   {entry}      入口文件
     *   {sources}    参与编译的全部源文件
     *   {main_class} 主类名，见 main_class
     *   {links}      自定义库的链接参数（-lfoo），没有时为空串，否则以空格开头
     * 占位符展开后的文件名都经过 shell_quote 转义
     */
    std::string command_template;

    /**
     * @brief 为真时 {sources} 只包含与入口文件在同一目录下的源文件
     */
    bool sources_from_entry_directory = false;

    /**
     * @brief 不参与编译的源文件后缀，比如 Go 的 "_test.go"
     */
    std::vector<std::string> excluded_suffixes;

    /**
     * @brief 从入口文件的源代码推导主类名，为空表示该语言没有主类的概念
     * 只提交了 code 时，源代码也会被保存为 <主类名><第一个扩展名>
     */
    std::string (*main_class)(const std::string &source) = nullptr;

    /**
     * @brief 自定义库的识别规则，按顺序匹配
     */
    std::vector<library_rule> library_rules;

    /**
     * @brief 文件名是否是该语言的源代码
     */
    bool is_source(const std::string &path) const;
};

/**
 * @brief 语言表，一个执行引擎通过这张表支持所有语言
 */
struct language_table {
    /**
     * @brief 构造内置的语言表：python、javascript、java、cpp、go
     */
    language_table();

    /**
     * @brief 替换某种语言的镜像
     * @throw unsupported_language_error 语言不存在
     */
    void override_image(const std::string &language, const std::string &image);

    /**
     * @brief 根据语言名或别名查找语言，不区分大小写
     * @throw unsupported_language_error 语言不存在
     */
    const language_profile &at(const std::string &language) const;

    bool supports(const std::string &language) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, language_profile> profiles;
    std::map<std::string, std::string> aliases;

    const language_profile *lookup(const std::string &language) const;
};

}  // namespace runner
