#pragma once

#include <string>
#include <vector>

namespace runner::docker {

/**
 * @brief tar 归档中的一个条目
 */
struct tar_entry {
    std::string path;
    std::string content;
    bool directory = false;
    unsigned mode = 0644;
    unsigned uid = 0;
    unsigned gid = 0;
};

/**
 * @brief 生成 ustar 格式的归档，用于通过容器引擎的 archive 接口写文件
 * 文件内容按字节原样写入，不经过任何 shell 转义。
 * 超过 ustar name/prefix 长度的路径通过 PAX 扩展头记录。
 */
struct tar_writer {
    /**
     * @param uid 归档中所有条目的属主
     * @param gid 归档中所有条目的属组
     */
    tar_writer(unsigned uid = 0, unsigned gid = 0);

    void add_directory(const std::string &path, unsigned mode = 0755);

    void add_file(const std::string &path, const std::string &content, unsigned mode = 0644);

    /**
     * @brief 追加结尾的两个空块，返回整个归档
     * 调用后不能再添加条目
     */
    std::string finish();

private:
    std::string buffer;
    unsigned uid, gid;
    bool finished = false;

    void add_entry(const std::string &path, char type, const std::string &content, unsigned mode);
    void write_header(const std::string &path, char type, size_t size, unsigned mode);
    void pad();
};

/**
 * @brief 解析 ustar 归档（支持 prefix 字段和 PAX path 记录）
 * @throw stream_error 归档损坏
 */
std::vector<tar_entry> read_tar(const std::string &archive);

}  // namespace runner::docker
