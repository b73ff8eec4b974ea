#include "fineinput/config_file.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fineinput {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    loaded_ = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        lines_.clear();
        keyToLine_.clear();
        values_.clear();
        dirty_ = false;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());

    loaded_ = true;
    return true;
}

void ConfigFile::parse(std::string_view content) {
    lines_.clear();
    keyToLine_.clear();
    values_.clear();
    dirty_ = false;

    size_t pos = 0;
    while (pos < content.size()) {
        size_t lineEnd = content.find('\n', pos);
        std::string_view lineView;
        if (lineEnd == std::string_view::npos) {
            lineView = content.substr(pos);
            pos = content.size();
        } else {
            lineView = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }

        if (!lineView.empty() && lineView.back() == '\r') {
            lineView.remove_suffix(1);
        }

        Line line;
        line.content = std::string(lineView);

        // Key lines start in column 0 and are not comments
        bool candidate = !lineView.empty() && lineView[0] != '#' &&
                         !std::isspace(static_cast<unsigned char>(lineView[0]));
        auto colonPos = candidate ? lineView.find(':') : std::string_view::npos;

        if (colonPos != std::string_view::npos) {
            std::string key(trim(lineView.substr(0, colonPos)));

            size_t valueStart = colonPos + 1;
            while (valueStart < lineView.size() &&
                   std::isspace(static_cast<unsigned char>(lineView[valueStart]))) {
                valueStart++;
            }

            line.key = key;
            line.valueStart = valueStart;
            line.isKeyValue = true;

            // Later lines override earlier ones for the same key
            keyToLine_[key] = lines_.size();

            auto valueText = trim(lineView.substr(valueStart));
            if (!valueText.empty()) {
                values_[key] = parseValue(valueText);
            } else {
                values_.erase(key);
            }
        }

        lines_.push_back(std::move(line));
    }
}

ConfigValue ConfigFile::parseValue(std::string_view text) {
    if (text == "true" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "no") {
        return false;
    }

    std::string str(text);
    const char* begin = str.c_str();
    const char* finish = begin + str.size();
    char* end = nullptr;

    long long intVal;
    if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        intVal = std::strtoll(begin, &end, 16);
    } else {
        intVal = std::strtoll(begin, &end, 10);
    }
    if (end != begin && end == finish) {
        return static_cast<int64_t>(intVal);
    }

    double floatVal = std::strtod(begin, &end);
    if (end != begin && end == finish) {
        return floatVal;
    }

    return str;
}

std::string ConfigFile::formatValue(const ConfigValue& value) {
    if (auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    return std::get<std::string>(value);
}

bool ConfigFile::save() {
    return saveAs(path_);
}

bool ConfigFile::saveAs(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    file << toString();
    if (!file.good()) {
        return false;
    }

    path_ = path;
    dirty_ = false;
    return true;
}

std::string ConfigFile::toString() const {
    std::string out;
    if (lines_.empty() && !header_.empty()) {
        out += header_;
        if (header_.back() != '\n') {
            out += '\n';
        }
    }
    for (const auto& line : lines_) {
        out += line.content;
        out += '\n';
    }
    return out;
}

bool ConfigFile::has(std::string_view key) const {
    return keyToLine_.contains(std::string(key));
}

std::optional<ConfigValue> ConfigFile::value(std::string_view key) const {
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    auto v = value(key);
    if (!v) {
        return std::string(defaultVal);
    }
    if (auto* s = std::get_if<std::string>(&*v)) {
        return *s;
    }
    return formatValue(*v);
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    auto v = value(key);
    if (v) {
        if (auto* i = std::get_if<int64_t>(&*v)) {
            return *i;
        }
    }
    return defaultVal;
}

double ConfigFile::getFloat(std::string_view key, double defaultVal) const {
    auto v = value(key);
    if (v) {
        if (auto* d = std::get_if<double>(&*v)) {
            return *d;
        }
        if (auto* i = std::get_if<int64_t>(&*v)) {
            return static_cast<double>(*i);
        }
    }
    return defaultVal;
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    auto v = value(key);
    if (v) {
        if (auto* b = std::get_if<bool>(&*v)) {
            return *b;
        }
    }
    return defaultVal;
}

int ConfigFile::findLine(std::string_view key) const {
    auto it = keyToLine_.find(std::string(key));
    if (it != keyToLine_.end()) {
        return static_cast<int>(it->second);
    }
    return -1;
}

void ConfigFile::setImpl(std::string_view key, ConfigValue value) {
    std::string formatted = formatValue(value);
    int lineIdx = findLine(key);

    if (lineIdx >= 0) {
        // Replace just the value portion of the existing line
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = line.content.substr(0, line.valueStart) + formatted;
    } else {
        Line newLine;
        newLine.key = std::string(key);
        newLine.content = std::string(key) + ": " + formatted;
        newLine.valueStart = key.size() + 2;  // "key: " length
        newLine.isKeyValue = true;

        keyToLine_[std::string(key)] = lines_.size();
        lines_.push_back(std::move(newLine));
    }

    values_[std::string(key)] = std::move(value);
    dirty_ = true;
}

void ConfigFile::set(std::string_view key, std::string_view value) {
    setImpl(key, std::string(value));
}

void ConfigFile::set(std::string_view key, int64_t value) {
    setImpl(key, value);
}

void ConfigFile::set(std::string_view key, double value) {
    setImpl(key, value);
}

void ConfigFile::set(std::string_view key, bool value) {
    setImpl(key, value);
}

void ConfigFile::remove(std::string_view key) {
    int lineIdx = findLine(key);
    if (lineIdx < 0) {
        return;
    }

    // Comment out the line instead of removing it
    auto& line = lines_[static_cast<size_t>(lineIdx)];
    line.content = "# " + line.content;
    line.isKeyValue = false;

    keyToLine_.erase(std::string(key));
    values_.erase(std::string(key));
    dirty_ = true;
}

}  // namespace fineinput
