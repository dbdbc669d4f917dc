#include "sandbox/language.hpp"
#include "common/exceptions.hpp"

namespace codebox::sandbox {
using namespace std;

const vector<language> &supported_languages() {
    static const vector<language> languages = {language::PYTHON, language::NODEJS, language::GO, language::CPP};
    return languages;
}

string to_string(language lang) {
    switch (lang) {
        case language::PYTHON:
            return "python";
        case language::NODEJS:
            return "nodejs";
        case language::GO:
            return "go";
        case language::CPP:
            return "cpp";
    }
    throw language_error("unsupported language: " + std::to_string((int)lang));
}

language parse_language(const string &name) {
    for (language lang : supported_languages())
        if (to_string(lang) == name)
            return lang;
    throw language_error("unsupported language: " + name);
}

ostream &operator<<(ostream &os, language lang) {
    return os << to_string(lang);
}

string language_config::shell_command() const {
    if (build_cmd.empty()) return run_cmd;
    return build_cmd + " && " + run_cmd;
}

static const char *PYTHON_PREFIX_CODE = R"(import signal, sys

def timeout_handler(signum, frame):
    print('Execution timeout!')
    sys.exit(1)

signal.signal(signal.SIGALRM, timeout_handler)
signal.alarm(10)
)";

language_config default_language_config(language lang) {
    language_config config;
    switch (lang) {
        case language::PYTHON:
            config.image = "python:3.11-slim";
            config.file_name = "main.py";
            config.run_cmd = "python3 main.py";
            config.prefix_code = PYTHON_PREFIX_CODE;
            config.postfix_code = "\nsignal.alarm(0)\n";
            config.environment = {{"PYTHONUNBUFFERED", "1"}, {"PYTHONDONTWRITEBYTECODE", "1"}};
            config.exclude_patterns = {"__pycache__/", "*.pyc", "*.pyo", ".pytest_cache/"};
            break;
        case language::NODEJS:
            config.image = "node:20-alpine";
            config.file_name = "index.js";
            config.run_cmd = "node index.js";
            config.exclude_patterns = {"node_modules/"};
            break;
        case language::GO:
            config.image = "golang:1.23-alpine";
            config.file_name = "main.go";
            config.build_cmd = "go build -o app main.go";
            config.run_cmd = "./app";
            // 容器内以 nobody 运行，没有 HOME，需要显式指定构建缓存的位置
            config.environment = {{"GOCACHE", "/tmp/go-cache"}, {"GOPATH", "/tmp/go"}};
            break;
        case language::CPP:
            config.image = "gcc:13";
            config.file_name = "main.cpp";
            config.build_cmd = "g++ -std=c++17 -O2 -o app main.cpp";
            config.run_cmd = "./app";
            config.exclude_patterns = {"*.o"};
            break;
    }
    return config;
}

string apply_hooks(const language_config &config, const string &code) {
    return config.prefix_code + code + config.postfix_code;
}

}  // namespace codebox::sandbox
