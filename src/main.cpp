#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include "common/config.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "docker/docker_engine.hpp"
#include "language/profile.hpp"
#include "sandbox/library.hpp"
#include "sandbox/provisioner.hpp"
#include "server/http_server.hpp"
#include "session/manager.hpp"
using namespace std;

static runner::server::http_server *server_instance = nullptr;

void sigintHandler(int /* signum */) {
    if (server_instance) server_instance->stop();
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) << "Unable to initialize libcurl";

    namespace po = boost::program_options;
    po::options_description desc("code-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration (container policy, timeouts, retry, images, server) from the given JSON file")
        ("address", po::value<string>(), "set the address to listen on, default to 0.0.0.0")
        ("port", po::value<unsigned short>(), "set the port to listen on, default to 9876. You can either pass it from environ PORT")
        ("docker-socket", po::value<string>(), "set the unix socket of the container engine, default to /var/run/docker.sock. You can either pass it from environ DOCKER_SOCKET")
        ("docker-api-version", po::value<string>(), "set the Docker Engine API version, default to v1.41")
        ("library-dir", po::value<string>(), "set the directory storing uploaded custom libraries by project id. You can either pass it from environ LIBRARY_DIR")
        ("library-url", po::value<string>(), "set the url to download custom libraries from, preferred over library-dir. You can either pass it from environ LIBRARY_URL")
        ("no-prune", "do not remove containers left by a previous run on startup")
        ("debug", "turn on the debug mode to print the communication with the container engine")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "code-runner: Run code submissions in sandbox containers, stream the output back" << endl
             << "This app requires access to the Docker Engine socket" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        runner::DEBUG = true;
    }

    runner::configuration config;
    if (vm.count("config")) {
        filesystem::path path(vm.at("config").as<string>());
        CHECK(filesystem::is_regular_file(path))
            << "Configuration file " << path << " does not exist";
        try {
            nlohmann::json::parse(runner::read_file_content(path)).get_to(config);
        } catch (std::exception &e) {
            LOG(FATAL) << "Configuration file " << path << " is malformed: " << e.what();
        }
    }

    if (vm.count("address")) {
        config.server.address = vm.at("address").as<string>();
    }

    if (vm.count("port")) {
        config.server.port = vm.at("port").as<unsigned short>();
    } else if (getenv("PORT")) {
        config.server.port = boost::lexical_cast<unsigned short>(getenv("PORT"));
    }

    if (vm.count("docker-socket")) {
        runner::DOCKER_SOCKET = vm.at("docker-socket").as<string>();
    } else {
        runner::DOCKER_SOCKET = get_env("DOCKER_SOCKET", runner::DOCKER_SOCKET);
    }

    if (vm.count("docker-api-version")) {
        runner::DOCKER_API_VERSION = vm.at("docker-api-version").as<string>();
    }

    if (vm.count("library-dir")) {
        runner::LIBRARY_DIR = filesystem::path(vm.at("library-dir").as<string>());
    } else if (getenv("LIBRARY_DIR")) {
        runner::LIBRARY_DIR = filesystem::path(getenv("LIBRARY_DIR"));
    }

    if (vm.count("library-url")) {
        runner::LIBRARY_URL = vm.at("library-url").as<string>();
    } else {
        runner::LIBRARY_URL = get_env("LIBRARY_URL", "");
    }

    runner::language_table languages;
    for (auto &[language, image] : config.images)
        languages.override_image(language, image);

    unique_ptr<runner::sandbox::library_store> libraries;
    if (!runner::LIBRARY_URL.empty()) {
        libraries = make_unique<runner::sandbox::remote_library_store>(runner::LIBRARY_URL);
        LOG(INFO) << "Custom libraries are downloaded from " << runner::LIBRARY_URL;
    } else if (!runner::LIBRARY_DIR.empty()) {
        CHECK(filesystem::is_directory(runner::LIBRARY_DIR))
            << "Library directory " << runner::LIBRARY_DIR << " does not exist";
        libraries = make_unique<runner::sandbox::local_library_store>(runner::LIBRARY_DIR);
        LOG(INFO) << "Custom libraries are read from " << runner::LIBRARY_DIR;
    } else {
        LOG(WARNING) << "Neither LIBRARY_URL nor LIBRARY_DIR is set, custom libraries are disabled";
    }

    runner::docker::docker_engine docker(runner::DOCKER_SOCKET, runner::DOCKER_API_VERSION);
    try {
        if (!docker.ping())
            LOG(WARNING) << "Container engine at " << runner::DOCKER_SOCKET << " does not respond";
    } catch (runner::runner_exception &e) {
        LOG(WARNING) << "Container engine at " << runner::DOCKER_SOCKET << " is unreachable: " << e.what();
    }

    if (!vm.count("no-prune")) {
        try {
            runner::sandbox::provisioner provisioner(docker, config);
            size_t pruned = provisioner.prune_stale();
            if (pruned > 0) LOG(INFO) << "Removed " << pruned << " stale containers";
        } catch (runner::runner_exception &e) {
            LOG(WARNING) << "Unable to remove stale containers: " << e;
        }
    }

    runner::session::session_manager manager(docker, libraries.get(), languages, config);
    runner::server::http_server server(manager, docker, languages, config);
    server_instance = &server;
    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);
    signal(SIGPIPE, SIG_IGN);

    try {
        server.run();
    } catch (std::exception &e) {
        LOG(ERROR) << "HTTP server crashed: " << boost::diagnostic_information(e);
    }

    LOG(INFO) << "Stopping all sessions";
    manager.shutdown(config.timeouts.helper);
    server_instance = nullptr;
    curl_global_cleanup();
    return 0;
}
