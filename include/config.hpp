#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 容器引擎（Docker）的 unix socket 路径
 * @defaultValue /var/run/docker.sock，可以通过环境变量 DOCKER_SOCKET 覆盖
 */
extern std::string DOCKER_SOCKET;

/**
 * @brief 调用的 Docker Engine API 版本
 */
extern std::string DOCKER_API_VERSION;

/**
 * @brief 本地的自定义库存放目录，按照项目 id 划分
 * 
 * LIBRARY_DIR
 * ├── 42 // project id
 * │   ├── foo-1.0.0.tgz // npm 包
 * │   ├── libbar.so // C++ 动态库
 * │   └── gson.jar // Java 库
 * └── ...
 */
extern std::filesystem::path LIBRARY_DIR;

/**
 * @brief 远程的自定义库下载地址，请求 LIBRARY_URL/<project id>/<file name>
 * 若为空，则使用 LIBRARY_DIR
 */
extern std::string LIBRARY_URL;

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后将输出容器引擎的 HTTP 通信细节
 */
extern bool DEBUG;

}  // namespace runner
