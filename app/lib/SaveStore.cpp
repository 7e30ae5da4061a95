#include "SaveStore.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <spdlog/fmt/fmt.h>
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {
template <typename... Args>
void save_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}
}


SaveStore::SaveStore(std::string file_path)
    : file_path_(Utils::expand_user_path(file_path)) {}


SaveRecord SaveStore::load() const
{
    SaveRecord record;
    std::ifstream file(file_path_);
    if (!file.is_open()) {
        save_log(spdlog::level::info, "No save file at {}, starting fresh", file_path_);
        return record;
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(reader_builder, file, &root, &errors)) {
        save_log(spdlog::level::warn, "Ignoring malformed save file {}: {}", file_path_, errors);
        return record;
    }
    if (!root.isObject()) {
        save_log(spdlog::level::warn, "Ignoring save file {}: top-level value is not an object", file_path_);
        return record;
    }

    const Json::Value& locale = root["locale"];
    if (locale.isString() && !locale.asString().empty()) {
        record.locale = locale.asString();
    }
    return record;
}


bool SaveStore::save(const SaveRecord& record) const
{
    const std::filesystem::path path = Utils::utf8_to_path(file_path_);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            save_log(spdlog::level::err, "Cannot create directory for save file {}: {}", file_path_, ec.message());
            return false;
        }
    }

    Json::Value root(Json::objectValue);
    root["locale"] = record.locale ? Json::Value(*record.locale) : Json::Value(Json::nullValue);

    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "";
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        save_log(spdlog::level::err, "Failed to open save file for writing: {}", file_path_);
        return false;
    }
    file << Json::writeString(writer_builder, root);
    file.flush();
    if (!file) {
        save_log(spdlog::level::err, "Failed to write save file: {}", file_path_);
        return false;
    }
    save_log(spdlog::level::debug, "Saved locale '{}' to {}", record.locale.value_or("null"), file_path_);
    return true;
}
