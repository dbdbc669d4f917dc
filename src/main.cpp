#include <glog/logging.h>
#include <signal.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <cstring>
#include <iostream>
#include <memory>
#include "common/exceptions.hpp"
#include "common/process.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/factory.hpp"
#include "server/protocol.hpp"
#include "server/server.hpp"
using namespace std;

void stop_handler(int /* signum */) {
    codebox::server::stop_server();
}

static void install_signal_handlers() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = stop_handler;
    sigemptyset(&action.sa_mask);
    // 不设置 SA_RESTART，使阻塞在读取标准输入上的线程被信号打断
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    // 调用方关闭标准输出时由写入失败来处理
    signal(SIGPIPE, SIG_IGN);
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    // 标准输出用于返回响应，日志只能写到标准错误
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("codebox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the JSON configuration file. You can either pass it from environ CODEBOX_CONFIG")
        ("backend", po::value<string>(), "set the execution backend: docker, podman or local. You can either pass it from environ CODEBOX_BACKEND")
        ("workers", po::value<int>(), "set the number of requests executed concurrently. You can either pass it from environ CODEBOX_WORKERS")
        ("scratch-dir", po::value<string>(), "set the directory to create temporary workspaces in. You can either pass it from environ CODEBOX_SCRATCH_DIR")
        ("debug", "turn on verbose logging. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codebox: execute untrusted code in isolated containers" << endl
             << "Reads one JSON request per line from stdin and writes one JSON response per line to stdout" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codebox " << codebox::server::SERVER_VERSION << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        FLAGS_v = max(FLAGS_v, 1);
    }

    codebox::configuration config;
    shared_ptr<codebox::sandbox::backend> backend;
    try {
        string config_path = vm.count("config") ? vm.at("config").as<string>() : codebox::get_env("CODEBOX_CONFIG", "");
        if (!config_path.empty()) {
            config = codebox::load_configuration(config_path);
            LOG(INFO) << "Loaded configuration from " << config_path;
        }

        if (vm.count("backend")) {
            config.sandbox.backend = vm.at("backend").as<string>();
        } else if (getenv("CODEBOX_BACKEND")) {
            config.sandbox.backend = getenv("CODEBOX_BACKEND");
        }

        if (vm.count("workers")) {
            config.server.workers = vm.at("workers").as<int>();
        } else if (getenv("CODEBOX_WORKERS")) {
            try {
                config.server.workers = boost::lexical_cast<int>(getenv("CODEBOX_WORKERS"));
            } catch (boost::bad_lexical_cast&) {
                throw codebox::configuration_error(string("CODEBOX_WORKERS is not a number: ") + getenv("CODEBOX_WORKERS"));
            }
        }

        if (vm.count("scratch-dir")) {
            config.sandbox.scratch_dir = vm.at("scratch-dir").as<string>();
        } else if (getenv("CODEBOX_SCRATCH_DIR")) {
            config.sandbox.scratch_dir = getenv("CODEBOX_SCRATCH_DIR");
        }

        config.validate();
        backend = codebox::sandbox::create_backend(config.sandbox, make_shared<codebox::posix_process_runner>());
    } catch (codebox::configuration_error& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return EXIT_FAILURE;
    }

    LOG(INFO) << "Using " << backend->name() << " backend, timeout " << config.sandbox.timeout_sec
              << "s, memory " << config.sandbox.memory_mb << "MB, scratch directory " << config.sandbox.scratch_root();

    codebox::sandbox::executor exec(config, backend);
    install_signal_handlers();
    codebox::server::serve(config, exec, cin, cout);

    LOG(INFO) << "codebox stopped";
    return EXIT_SUCCESS;
}
