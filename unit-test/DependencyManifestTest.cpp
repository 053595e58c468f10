#include <nlohmann/json.hpp>
#include <atomic>
#include <thread>
#include "common/utils.hpp"
#include "docker/stream.hpp"
#include "sandbox/dependency.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/fake_engine.hpp"

using namespace std;
using namespace runner;
using namespace runner::sandbox;
using namespace nlohmann;

class DependencyManifestTest : public ::testing::Test {
protected:
    language_table languages;

    optional<dependency_manifest> detect(const string &language, const project &proj) {
        return detect_manifest(languages.at(language), proj);
    }
};

TEST_F(DependencyManifestTest, NoDependenciesTest) {
    project proj{{{"main.py", "print(1)"}}, "main.py"};
    EXPECT_FALSE(detect("python", proj));
    proj = {{{"main.js", "1"}}, "main.js"};
    EXPECT_FALSE(detect("javascript", proj));
    proj = {{{"main.cpp", "int main(){}"}}, "main.cpp"};
    EXPECT_FALSE(detect("cpp", proj));
    proj = {{{"Main.java", "class Main{}"}}, "Main.java"};
    EXPECT_FALSE(detect("java", proj));
}

TEST_F(DependencyManifestTest, GoIgnoresDependenciesTest) {
    project proj{{{"main.go", "package main"}}, "main.go"};
    proj.dependencies = {{"github.com/foo/bar", "v1.0.0"}};
    EXPECT_FALSE(detect("go", proj));
}

TEST_F(DependencyManifestTest, NpmFromMapTest) {
    project proj{{{"main.js", "require('lodash')"}}, "main.js"};
    proj.dependencies = {{"lodash", "^4.17.21"}};
    auto manifest = detect("javascript", proj);
    ASSERT_TRUE(manifest);
    EXPECT_EQ(manifest->manager, package_manager::NPM);
    EXPECT_EQ(manifest->artifacts, vector<string>{"node_modules"});
    ASSERT_EQ(manifest->generated.size(), 1);
    EXPECT_EQ(manifest->generated[0].path, "package.json");
    json package = json::parse(manifest->generated[0].content);
    EXPECT_EQ(package["dependencies"]["lodash"], "^4.17.21");
    EXPECT_EQ(package["main"], "main.js");
}

TEST_F(DependencyManifestTest, NpmMergeIntoPackageJsonTest) {
    project proj{{{"main.js", "1"},
                  {"package.json", R"({"name":"demo","dependencies":{"express":"^4.0.0"},"scripts":{"start":"node main.js"}})"}},
                 "main.js"};
    proj.dependencies = {{"lodash", "*"}};
    auto manifest = detect("javascript", proj);
    ASSERT_TRUE(manifest);
    ASSERT_EQ(manifest->generated.size(), 1);
    json package = json::parse(manifest->generated[0].content);
    EXPECT_EQ(package["name"], "demo");
    EXPECT_EQ(package["dependencies"]["express"], "^4.0.0");
    EXPECT_EQ(package["dependencies"]["lodash"], "*");
    EXPECT_EQ(package["scripts"]["start"], "node main.js");
}

TEST_F(DependencyManifestTest, NpmPackageJsonOnlyTest) {
    project proj{{{"main.js", "1"}, {"package.json", R"({"dependencies":{"express":"^4.0.0"}})"}}, "main.js"};
    auto manifest = detect("javascript", proj);
    ASSERT_TRUE(manifest);
    EXPECT_TRUE(manifest->generated.empty());

    project empty{{{"main.js", "1"}, {"package.json", R"({"name":"x"})"}}, "main.js"};
    EXPECT_FALSE(detect("javascript", empty));
}

TEST_F(DependencyManifestTest, NpmInvalidPackageJsonTest) {
    project proj{{{"main.js", "1"}, {"package.json", "{not json"}}, "main.js"};
    EXPECT_THROW(detect("javascript", proj), validation_error);
}

TEST_F(DependencyManifestTest, PipFromMapTest) {
    project proj{{{"main.py", "import requests"}}, "main.py"};
    proj.dependencies = {{"requests", "2.31.0"}, {"numpy", "*"}, {"flask", ">=2.0"}};
    auto manifest = detect("python", proj);
    ASSERT_TRUE(manifest);
    EXPECT_EQ(manifest->manager, package_manager::PIP);
    ASSERT_EQ(manifest->generated.size(), 1);
    EXPECT_EQ(manifest->generated[0].path, "requirements.txt");
    EXPECT_EQ(manifest->generated[0].content, "flask>=2.0\nnumpy\nrequests==2.31.0\n");
}

TEST_F(DependencyManifestTest, PipRequirementsTest) {
    project proj{{{"main.py", "1"}, {"requirements.txt", "# tools\nrequests\n"}}, "main.py"};
    auto manifest = detect("python", proj);
    ASSERT_TRUE(manifest);
    EXPECT_TRUE(manifest->generated.empty());
    EXPECT_EQ(manifest->artifacts, vector<string>{".pyuser"});

    project comments{{{"main.py", "1"}, {"requirements.txt", "# nothing\n\n"}}, "main.py"};
    EXPECT_FALSE(detect("python", comments));
}

TEST_F(DependencyManifestTest, CmakePackagesTest) {
    string cmake = "cmake_minimum_required(VERSION 3.10)\n"
                   "find_package(Threads REQUIRED)\n"
                   "find_package( fmt REQUIRED)\n"
                   "FIND_PACKAGE(nlohmann_json 3.2.0)\n"
                   "find_package(fmt)\n"
                   "find_package(Boost COMPONENTS system)\n";
    EXPECT_EQ(cmake_packages(cmake), (vector<string>{"fmt", "nlohmann_json"}));
}

TEST_F(DependencyManifestTest, ConanFromCmakeTest) {
    project proj{{{"main.cpp", "int main(){}"},
                  {"CMakeLists.txt", "find_package(fmt REQUIRED)\nfind_package(ZLIB REQUIRED)\n"}},
                 "main.cpp"};
    proj.dependencies = {{"spdlog", "1.11.0"}};
    auto manifest = detect("cpp", proj);
    ASSERT_TRUE(manifest);
    EXPECT_EQ(manifest->manager, package_manager::CONAN);
    ASSERT_EQ(manifest->generated.size(), 1);
    EXPECT_EQ(manifest->generated[0].path, "conanfile.txt");
    EXPECT_EQ(manifest->generated[0].content,
              "[requires]\nfmt/10.1.1\nspdlog/1.11.0\nzlib/[*]\n\n[generators]\nCMakeDeps\nCMakeToolchain\nPkgConfigDeps\n");
}

TEST_F(DependencyManifestTest, ConanfileUsedAsIsTest) {
    project proj{{{"main.cpp", "int main(){}"}, {"conanfile.txt", "[requires]\nfmt/9.1.0\n"}}, "main.cpp"};
    auto manifest = detect("cpp", proj);
    ASSERT_TRUE(manifest);
    EXPECT_TRUE(manifest->generated.empty());
    EXPECT_EQ(manifest->identity, "[requires]\nfmt/9.1.0\n");
}

TEST_F(DependencyManifestTest, MavenFromMapTest) {
    project proj{{{"Main.java", "class Main{}"}}, "Main.java"};
    proj.dependencies = {{"com.google.code.gson:gson", "2.10.1"}, {"org.json:json", "*"}};
    auto manifest = detect("java", proj);
    ASSERT_TRUE(manifest);
    ASSERT_EQ(manifest->generated.size(), 1);
    auto &pom = manifest->generated[0].content;
    EXPECT_NE(pom.find("<groupId>com.google.code.gson</groupId>"), string::npos);
    EXPECT_NE(pom.find("<artifactId>gson</artifactId>"), string::npos);
    EXPECT_NE(pom.find("<version>2.10.1</version>"), string::npos);
    EXPECT_NE(pom.find("<version>LATEST</version>"), string::npos);
}

TEST_F(DependencyManifestTest, MavenBadCoordinateTest) {
    project proj{{{"Main.java", "class Main{}"}}, "Main.java"};
    proj.dependencies = {{"gson", "2.10.1"}};
    EXPECT_THROW(detect("java", proj), validation_error);
}

TEST_F(DependencyManifestTest, CacheKeyTest) {
    auto &python = languages.at("python");
    dependency_manifest a{package_manager::PIP, {}, "requests\n", {".pyuser"}};
    dependency_manifest b{package_manager::PIP, {}, "requests\n", {".pyuser"}};
    dependency_manifest c{package_manager::PIP, {}, "numpy\n", {".pyuser"}};
    EXPECT_EQ(cache_key(python, a), cache_key(python, b));
    EXPECT_NE(cache_key(python, a), cache_key(python, c));
    EXPECT_EQ(cache_key(python, a).rfind("python-", 0), 0);
}

TEST_F(DependencyManifestTest, ClassifyLogTest) {
    using kind = dependency_install_error::failure_kind;
    EXPECT_EQ(classify_install_log("npm ERR! code EAI_AGAIN\nnpm ERR! getaddrinfo EAI_AGAIN registry.npmjs.org"), kind::NETWORK);
    EXPECT_EQ(classify_install_log("ERROR: Could not find a version that satisfies the requirement nosuchpkg"), kind::RESOLUTION);
    EXPECT_EQ(classify_install_log("npm ERR! code E404\nnpm ERR! 404 Not Found - GET https://registry.npmjs.org/x"), kind::RESOLUTION);
    EXPECT_EQ(classify_install_log("segmentation fault"), kind::GENERIC);
}

TEST_F(DependencyManifestTest, LogExcerptTest) {
    EXPECT_EQ(log_excerpt("short"), "short");
    string log = string(2000, 'a') + "tail";
    EXPECT_EQ(log_excerpt(log).size(), 1000);
    EXPECT_EQ(log_excerpt(log, 4), "tail");
}

class DependencyInstallerTest : public ::testing::Test {
protected:
    test::fake_engine docker;
    configuration config;
    language_table languages;
    container_handle handle;

    void SetUp() override {
        config.retry.install = {2, chrono::milliseconds(1), 1.0};
        config.timeouts.npm = chrono::seconds(1);
        docker::container_spec spec;
        spec.name = "nexusquest-project-dep";
        string id = docker.create_container(spec);
        docker.start_container(id);
        handle = {id, spec.name, "dep", "javascript"};
    }

    size_t count_commands(const string &needle) {
        size_t count = 0;
        for (auto &command : docker.commands())
            if (command.find(needle) != string::npos) ++count;
        return count;
    }
};

TEST_F(DependencyInstallerTest, InstallAndPopulateTest) {
    dependency_installer installer(docker, config);
    dependency_manifest manifest{package_manager::NPM, {}, "{}", {"node_modules"}};
    auto result = installer.install(handle, languages.at("javascript"), manifest);
    EXPECT_FALSE(result.from_cache);
    EXPECT_EQ(count_commands("npm install"), 1);
    EXPECT_EQ(count_commands("touch"), 1);
}

TEST_F(DependencyInstallerTest, CacheHitTest) {
    docker.set_handler([](const string &, const docker::exec_options &) {
        return test::scripted_exec{};  // 所有命令都成功，包括缓存检查
    });
    dependency_installer installer(docker, config);
    dependency_manifest manifest{package_manager::NPM, {}, "{}", {"node_modules"}};
    auto result = installer.install(handle, languages.at("javascript"), manifest);
    EXPECT_TRUE(result.from_cache);
    EXPECT_EQ(count_commands("npm install"), 0);
}

TEST_F(DependencyInstallerTest, CacheDisabledTest) {
    config.container.mount_dependency_cache = false;
    dependency_installer installer(docker, config);
    dependency_manifest manifest{package_manager::NPM, {}, "{}", {"node_modules"}};
    installer.install(handle, languages.at("javascript"), manifest);
    EXPECT_EQ(count_commands(".cache-complete"), 0);
}

TEST_F(DependencyInstallerTest, NetworkFailureRetriedTest) {
    docker.set_handler([](const string &command, const docker::exec_options &) {
        if (command.find("npm install") != string::npos)
            return test::stdout_exec("npm ERR! getaddrinfo EAI_AGAIN registry.npmjs.org\n", 1);
        return test::fake_engine::default_exec(command);
    });
    dependency_installer installer(docker, config);
    dependency_manifest manifest{package_manager::NPM, {}, "{}", {"node_modules"}};
    try {
        installer.install(handle, languages.at("javascript"), manifest);
        FAIL() << "expected dependency_install_error";
    } catch (const dependency_install_error &ex) {
        EXPECT_EQ(ex.failure, dependency_install_error::failure_kind::NETWORK);
        EXPECT_NE(ex.log_excerpt.find("EAI_AGAIN"), string::npos);
        EXPECT_NE(string(ex.what()).find("network"), string::npos);
    }
    EXPECT_EQ(count_commands("npm install"), 2);
    EXPECT_EQ(count_commands("touch"), 0);
}

TEST_F(DependencyInstallerTest, ResolutionFailureNotRetriedTest) {
    docker.set_handler([](const string &command, const docker::exec_options &) {
        if (command.find("npm install") != string::npos)
            return test::stdout_exec("npm ERR! code ETARGET\nnpm ERR! No matching version found for lodash@99\n", 1);
        return test::fake_engine::default_exec(command);
    });
    dependency_installer installer(docker, config);
    dependency_manifest manifest{package_manager::NPM, {}, "{}", {"node_modules"}};
    try {
        installer.install(handle, languages.at("javascript"), manifest);
        FAIL() << "expected dependency_install_error";
    } catch (const dependency_install_error &ex) {
        EXPECT_EQ(ex.failure, dependency_install_error::failure_kind::RESOLUTION);
    }
    EXPECT_EQ(count_commands("npm install"), 1);
}

TEST_F(DependencyInstallerTest, TimeoutTest) {
    docker.set_handler([](const string &command, const docker::exec_options &) {
        test::scripted_exec script = test::fake_engine::default_exec(command);
        if (command.find("npm install") != string::npos) script.hang = true;
        return script;
    });
    dependency_installer installer(docker, config);
    dependency_manifest manifest{package_manager::NPM, {}, "{}", {"node_modules"}};
    EXPECT_THROW(installer.install(handle, languages.at("javascript"), manifest), timeout_error);
}

TEST_F(DependencyInstallerTest, InstallTimeoutPerManagerTest) {
    config.timeouts.maven = chrono::seconds(180);
    config.timeouts.conan = chrono::seconds(300);
    dependency_installer installer(docker, config);
    EXPECT_EQ(installer.install_timeout(package_manager::NPM), chrono::seconds(1));
    EXPECT_EQ(installer.install_timeout(package_manager::MAVEN), chrono::seconds(180));
    EXPECT_EQ(installer.install_timeout(package_manager::CONAN), chrono::seconds(300));
}

TEST_F(DependencyInstallerTest, SameKeyInstallsSerializeTest) {
    atomic<int> running{0}, peak{0};
    docker.set_handler([&](const string &command, const docker::exec_options &) {
        if (command.find("npm install") != string::npos) {
            int now = ++running;
            peak = max(peak.load(), now);
            this_thread::sleep_for(chrono::milliseconds(200));
            --running;
        }
        return test::fake_engine::default_exec(command);
    });
    dependency_installer installer(docker, config);
    dependency_manifest manifest{package_manager::NPM, {}, "{}", {"node_modules"}};

    vector<thread> sessions;
    for (int i = 0; i < 2; ++i)
        sessions.emplace_back([&] { installer.install(handle, languages.at("javascript"), manifest); });
    for (auto &session : sessions) session.join();

    EXPECT_EQ(count_commands("npm install"), 2);
    EXPECT_EQ(peak.load(), 1);
}

TEST_F(DependencyInstallerTest, CancelledWaiterExitsTest) {
    config.timeouts.npm = chrono::seconds(30);
    docker.set_handler([](const string &command, const docker::exec_options &) {
        test::scripted_exec script = test::fake_engine::default_exec(command);
        if (command.find("npm install") != string::npos) script.hang = true;
        return script;
    });
    dependency_installer installer(docker, config);
    dependency_manifest manifest{package_manager::NPM, {}, "{}", {"node_modules"}};

    atomic<bool> stop_first{false}, stop_second{false};
    thread first([&] {
        EXPECT_THROW(installer.install(handle, languages.at("javascript"), manifest, [&] { return stop_first.load(); }),
                     operation_cancelled);
    });
    ASSERT_TRUE(wait_until([&] { return count_commands("npm install") == 1; }));

    elapsed_time timer;
    thread second([&] {
        EXPECT_THROW(installer.install(handle, languages.at("javascript"), manifest, [&] { return stop_second.load(); }),
                     operation_cancelled);
    });
    this_thread::sleep_for(chrono::milliseconds(300));
    stop_second = true;
    second.join();
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 2000);
    EXPECT_EQ(count_commands("npm install"), 1);

    stop_first = true;
    first.join();
}
