/**
 * @file WriterOptions.cpp
 * @brief Writer options validation and JSON persistence
 */

#include "casfile/WriterOptions.h"

#include "casfile/HashUtils.h"

#include <cstdio>
#include <fstream>

namespace CasFile {

bool parseOctalMode(const std::string& text, mode_t& out) {
    if (text.empty() || text.size() > 4) {
        return false;
    }
    mode_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '7') {
            return false;
        }
        value = static_cast<mode_t>(value * 8 + static_cast<mode_t>(c - '0'));
    }
    out = value;
    return true;
}

std::string formatOctalMode(mode_t mode) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04o", static_cast<unsigned>(mode & 07777));
    return buf;
}

bool WriterOptions::validate(Status& status) const {
    status.clear();

    if (tempSuffix.empty()) {
        status = Status::invalidArgument("temp_suffix must not be empty");
        return false;
    }
    if (tempSuffix.find('/') != std::string::npos) {
        status = Status::invalidArgument("temp_suffix must not contain '/': " + tempSuffix);
        return false;
    }

    HashUtils::IncrementalHash hasher(digestAlgorithm);
    if (!hasher.isValid()) {
        status = Status::invalidArgument("Unknown digest algorithm: " + digestAlgorithm);
        return false;
    }
    return true;
}

nlohmann::json WriterOptions::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    out["temp_suffix"] = tempSuffix;
    out["digest_algorithm"] = digestAlgorithm;
    out["dir_mode"] = formatOctalMode(dirMode);
    out["file_mode"] = formatOctalMode(fileMode);
    return out;
}

WriterOptions WriterOptions::fromJson(const nlohmann::json& j) {
    WriterOptions opts;
    if (!j.is_object()) {
        return opts;
    }

    if (j.contains("temp_suffix") && j["temp_suffix"].is_string()) {
        opts.tempSuffix = j["temp_suffix"].get<std::string>();
    }
    if (j.contains("digest_algorithm") && j["digest_algorithm"].is_string()) {
        opts.digestAlgorithm = j["digest_algorithm"].get<std::string>();
    }

    mode_t mode = 0;
    if (j.contains("dir_mode") && j["dir_mode"].is_string() &&
        parseOctalMode(j["dir_mode"].get<std::string>(), mode)) {
        opts.dirMode = mode;
    }
    if (j.contains("file_mode") && j["file_mode"].is_string() &&
        parseOctalMode(j["file_mode"].get<std::string>(), mode)) {
        opts.fileMode = mode;
    }

    return opts;
}

bool WriterOptions::loadFromFile(const std::filesystem::path& path,
                                 WriterOptions& out,
                                 Status& status) {
    status.clear();

    std::ifstream in(path);
    if (!in) {
        status = Status::invalidArgument("Cannot open config file: " + path.string());
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        status = Status::invalidArgument("Config file is not valid JSON: " + path.string());
        return false;
    }

    out = fromJson(j);
    return out.validate(status);
}

}  // namespace CasFile
