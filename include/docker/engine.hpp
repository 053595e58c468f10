#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/exceptions.hpp"

namespace runner::docker {

/**
 * @brief 创建容器所需的参数
 */
struct container_spec {
    std::string name;
    std::string image;
    std::vector<std::string> cmd;
    std::vector<std::string> env;
    std::map<std::string, std::string> labels;

    int64_t memory_bytes = 0;
    int64_t nano_cpus = 0;
    int64_t pids_limit = 0;

    /**
     * @brief "none" 表示禁用网络，"bridge" 表示允许访问外网
     */
    std::string network_mode = "none";
    std::vector<std::string> dns;

    /**
     * @brief 卷挂载，格式为 "<volume>:<path>:rw"
     */
    std::vector<std::string> binds;

    /**
     * @brief tmpfs 挂载点到挂载选项的映射
     */
    std::map<std::string, std::string> tmpfs;
};

/**
 * @brief 转换为 POST /containers/create 的请求体
 */
void to_json(nlohmann::json &j, const container_spec &spec);

/**
 * @brief 在容器中执行命令的参数
 */
struct exec_options {
    std::vector<std::string> cmd;

    /**
     * @brief 执行用户，格式为 "uid:gid"，空表示容器默认用户
     */
    std::string user;

    std::string working_dir;
    std::vector<std::string> env;

    /**
     * @brief 是否连接标准输入
     */
    bool attach_stdin = false;
};

void to_json(nlohmann::json &j, const exec_options &options);

enum class read_status {
    DATA,
    TIMEOUT,
    END
};

/**
 * @brief 一个正在执行的 exec 的双向字节流
 * 读到的是多路复用的原始字节，需要通过 frame_demuxer 解析
 */
struct exec_stream {
    virtual ~exec_stream();

    /**
     * @brief 读取一段数据，至多等待 timeout
     * @param chunk 读到数据时保存数据
     * @return DATA 读到了数据，TIMEOUT 超时，END 流已结束
     * @throw stream_error 读取失败
     */
    virtual read_status read(std::string &chunk, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 写入进程的标准输入
     * @throw stream_error 写入失败，一般是进程已经退出
     */
    virtual void write(const std::string &data) = 0;

    /**
     * @brief 关闭标准输入（半关闭），进程将读到 EOF
     */
    virtual void close_input() = 0;

    /**
     * @brief 关闭连接，之后的 read 返回 END
     */
    virtual void close() = 0;

    /**
     * @brief 流结束后查询进程的退出码
     * @return 退出码，进程仍在运行或者无法得知时返回 -1
     */
    virtual int exit_code() = 0;
};

struct container_info {
    std::string id;
    std::string name;
    std::string state;
    std::map<std::string, std::string> labels;
};

/**
 * @class engine
 * @brief 容器引擎接口
 * 失败时抛出 network_error（无法连接引擎）或者 engine_error（引擎返回了错误状态码）
 */
struct engine {
    virtual ~engine();

    /**
     * @brief 检查容器引擎是否可以访问
     */
    virtual bool ping() = 0;

    /**
     * @brief 创建容器
     * @return 容器 id
     * @throw engine_error 404 表示镜像不存在，409 表示容器名已被占用
     */
    virtual std::string create_container(const container_spec &spec) = 0;

    virtual void start_container(const std::string &id) = 0;

    /**
     * @brief 停止容器
     * @param timeout_seconds 等待进程退出的秒数，超时后杀死进程
     * @throw engine_error 304 表示容器已经停止，404 表示容器不存在
     */
    virtual void stop_container(const std::string &id, int timeout_seconds) = 0;

    /**
     * @brief 删除容器
     * @param id 容器 id 或者容器名
     * @throw engine_error 404 表示容器不存在
     */
    virtual void remove_container(const std::string &id, bool force) = 0;

    /**
     * @brief 列出带有某个 label 的所有容器（包括已停止的）
     */
    virtual std::vector<container_info> list_containers(const std::string &label) = 0;

    /**
     * @brief 将 tar 归档解压到容器中的 path 目录下
     * path 必须已经存在
     */
    virtual void put_archive(const std::string &id, const std::string &path, const std::string &archive) = 0;

    /**
     * @brief 在容器中执行命令，并连接到它的输出流
     */
    virtual std::unique_ptr<exec_stream> exec(const std::string &id, const exec_options &options) = 0;
};

/**
 * @brief 判断容器引擎的错误是否值得重试
 * 连接失败、409 冲突以及 5xx 错误是暂时的；404 等错误重试也不会成功
 */
bool is_transient(const runner_exception &ex);

/**
 * @brief 一次执行到结束的结果
 */
struct exec_result {
    int exit_code = -1;
    std::string out;
    std::string err;

    /**
     * @brief stdout 和 stderr 按到达顺序拼接的内容
     */
    std::string combined;
};

/**
 * @brief 执行命令并等待结束，收集全部输出
 * 用于依赖安装、合并自定义库等辅助脚本
 * @param timeout 超时时间
 * @param cancelled 返回真时立即放弃执行
 * @throw timeout_error 超时
 * @throw operation_cancelled 被取消
 */
exec_result run_to_completion(engine &docker, const std::string &id, const exec_options &options,
                              std::chrono::milliseconds timeout,
                              const std::function<bool()> &cancelled = {});

}  // namespace runner::docker
