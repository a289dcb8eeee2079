#pragma once
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include "code_model.hpp"

namespace code_intelligence::testing {

namespace fs = std::filesystem;

// Scratch project directory removed on destruction.
class TempProject {
public:
    explicit TempProject(const std::string& name = "project") {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        base_ = fs::temp_directory_path() /
                ("codeintel_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        root_ = base_ / name;
        fs::create_directories(root_);
    }

    ~TempProject() {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    TempProject(const TempProject&) = delete;
    TempProject& operator=(const TempProject&) = delete;

    void write(const std::string& rel, const std::string& content) const {
        fs::path p = root_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void remove(const std::string& rel) const {
        std::error_code ec;
        fs::remove(root_ / rel, ec);
    }

    std::string path() const { return root_.string(); }
    fs::path root() const { return root_; }

private:
    fs::path base_;
    fs::path root_;
};

// main imports utils.helper and models.User.
inline void write_sample_python_project(const TempProject& project) {
    project.write("main.py",
                  "from utils import helper\n"
                  "from models import User\n"
                  "\n"
                  "def main():\n"
                  "    user = User(\"ada\")\n"
                  "    if user.name:\n"
                  "        return helper(user)\n"
                  "    return None\n");
    project.write("utils.py",
                  "def helper(value):\n"
                  "    \"\"\"Formats a value.\"\"\"\n"
                  "    return str(value)\n");
    project.write("models.py",
                  "class User:\n"
                  "    def __init__(self, name):\n"
                  "        self.name = name\n"
                  "\n"
                  "    def greet(self):\n"
                  "        return \"hi \" + self.name\n");
}

inline const Symbol* find_symbol(const ProjectIndex& index, const std::string& name, SymbolKind kind) {
    for (const auto* s : index.find_symbols(name)) {
        if (s->kind == kind) return s;
    }
    return nullptr;
}

} // namespace code_intelligence::testing
