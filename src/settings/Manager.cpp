#include "settings/Store.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

using namespace fa::settings;

namespace {

bool isSettingName(const std::string& name) {
    return !name.empty() && name.find('/') == std::string::npos && !name.starts_with('.') && !name.ends_with(".tmp");
}

}

Manager::Manager(const runtime::Context& ctx, fs::path dir) : ctx_(ctx), dir_(std::move(dir)) {
    fs::create_directories(dir_);
}

std::shared_ptr<Manager> Manager::fromConfig(const runtime::Context& ctx) {
    return std::make_shared<Manager>(ctx, ctx.conf().settings.path);
}

nlohmann::json Manager::contentsMap() const {
    std::scoped_lock lock(mutex_);
    auto map = nlohmann::json::object();

    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        std::error_code fileEc;
        if (!it->is_regular_file(fileEc) || !isSettingName(name)) continue;

        std::ifstream in(it->path(), std::ios::binary);
        if (!in) continue;
        map[name] = std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    return map;
}

std::vector<std::string> Manager::update(const nlohmann::json& changed) {
    std::vector<std::string> written;
    if (!changed.is_object()) throw std::invalid_argument("settings update must be a mapping");

    std::scoped_lock lock(mutex_);
    for (const auto& [name, contents] : changed.items()) {
        if (!isSettingName(name) || !contents.is_string()) {
            ctx_.log->sync()->warn("[SettingsManager] Ignoring invalid setting '{}'", name);
            continue;
        }

        const auto target = dir_ / name;
        const auto tmp = fs::path(target.string() + ".tmp");
        try {
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                out << contents.get<std::string>();
                out.flush();
                if (!out) throw std::runtime_error(fmt::format("Unable to write '{}'", tmp.string()));
            }
            fs::rename(tmp, target);
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(tmp, ec);
            ctx_.log->sync()->error("[SettingsManager] Failed to apply setting '{}': {}", name, e.what());
            continue;
        }
        written.push_back(name);
    }
    return written;
}
