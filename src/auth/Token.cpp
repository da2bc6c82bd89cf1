#include "auth/Token.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace fa::auth {

Token::Token(std::string source) {
    if (source.starts_with(kFilePrefix)) file_ = fs::path(source.substr(kFilePrefix.size()));
    else inline_ = std::move(source);
}

std::string Token::value() const {
    std::scoped_lock lock(mutex_);
    if (!file_) return inline_;

    std::ifstream in(*file_, std::ios::binary);
    if (!in) return {};
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void Token::persist(const std::string& token) {
    if (!file_) throw std::logic_error("Inline auth tokens cannot be persisted");

    std::scoped_lock lock(mutex_);
    if (file_->has_parent_path()) fs::create_directories(file_->parent_path());

    const auto tmp = fs::path(file_->string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error(fmt::format("Unable to write auth token to '{}'", tmp.string()));
        out << token;
        out.flush();
        if (!out) throw std::runtime_error(fmt::format("Unable to write auth token to '{}'", tmp.string()));
    }
    ::chmod(tmp.c_str(), 0600);
    fs::rename(tmp, *file_);
}

}
