#include "program.hpp"

namespace runner {
using namespace std;

const project_file *project::find(const string &path) const {
    for (auto &file : files)
        if (file.path == path)
            return &file;
    return nullptr;
}

}  // namespace runner
