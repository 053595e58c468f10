#include "config.hpp"

namespace runner {
using namespace std;

string DOCKER_SOCKET = "/var/run/docker.sock";
string DOCKER_API_VERSION = "v1.41";
filesystem::path LIBRARY_DIR;
string LIBRARY_URL;
bool DEBUG = false;

}  // namespace runner
