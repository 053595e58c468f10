#pragma once

#include <string>
#include <vector>
#include "language/profile.hpp"
#include "program.hpp"

namespace runner {

/**
 * @brief 从 Java 源代码中推导主类名
 * 取第一个 public class，如果源代码声明了 package，返回带包名的全限定类名
 * @return 主类名，找不到 public class 时返回 "Main"
 */
std::string java_main_class(const std::string &source);

/**
 * @brief 从库文件名推导链接名，比如 "libfoo.so.1" -> "foo"
 * @return 不是 lib*.so 或 lib*.a 时返回空串
 */
std::string native_link_name(const std::string &file_name);

/**
 * @brief 生成在容器工作目录中编译并运行项目的 shell 命令
 * 该函数没有副作用，命令中的所有文件名都经过 shell_quote 转义。
 * 编译型语言会把所有可识别的源文件传给一次编译器调用，然后运行产物；
 * 暂存的自定义库所在目录（include/、lib/、node_modules、.pyuser）会被加入查找路径。
 * @param profile 语言
 * @param proj 项目，entry_file 必须已经确定
 * @param libraries 合并进工作目录的自定义库文件名，C++ 的 lib*.so/lib*.a 会被 -l 链接
 * @return 交给 sh -c 执行的命令
 * @throw unsupported_language_error 语言没有对应的命令模板
 */
std::string build_command(const language_profile &profile, const project &proj,
                          const std::vector<std::string> &libraries = {});

}  // namespace runner
