#include "seedkeeper/cleanup/directive_file.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"
#include <json/json.h>
#include <memory>
#include <system_error>

namespace seedkeeper::cleanup {

using core::utils::FileUtils;
using core::utils::StringUtils;

namespace {

bool parse_json(const std::string& text, Json::Value& root, std::string& error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &root, &error);
}

Json::Value to_value(const Directive& directive) {
    Json::Value value(Json::objectValue);
    value["action"] = to_string(directive.action);
    if (!directive.hash.empty()) {
        value["hash"] = directive.hash;
    }
    if (!directive.name_pattern.empty()) {
        value["name"] = directive.name_pattern;
    }
    if (directive.delete_files) {
        value["delete_files"] = *directive.delete_files;
    }
    if (!directive.reason.empty()) {
        value["reason"] = directive.reason;
    }
    return value;
}

std::string write_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

void parse_fields(const Json::Value& entry, DirectiveBatch& batch) {
    if (!entry.isObject()) {
        batch.errors.push_back("directive is not an object");
        return;
    }
    
    auto action_name = entry.get("action", "delete");
    auto action = action_name.isString() ? parse_directive_action(action_name.asString()) : std::nullopt;
    if (!action) {
        batch.errors.push_back("unknown action: " + write_compact(action_name));
        return;
    }
    
    Directive directive;
    directive.action = *action;
    directive.hash = StringUtils::trim(entry.get("hash", "").asString());
    directive.name_pattern = StringUtils::trim(entry.get("name", "").asString());
    directive.reason = entry.get("reason", "").asString();
    if (entry.isMember("delete_files")) {
        if (!entry["delete_files"].isBool()) {
            batch.errors.push_back("delete_files must be a boolean");
            return;
        }
        directive.delete_files = entry["delete_files"].asBool();
    }
    
    if (directive.hash.empty() &&
        (directive.action != DirectiveAction::DELETE || directive.name_pattern.empty())) {
        batch.errors.push_back(std::string(to_string(directive.action)) + " directive without a target");
        return;
    }
    
    batch.directives.push_back(std::move(directive));
}

void parse_entry(const Json::Value& entry, DirectiveBatch& batch) {
    try {
        parse_fields(entry, batch);
    } catch (const Json::Exception& e) {
        batch.errors.push_back(std::string("bad field type: ") + e.what());
    }
}

} // namespace

const char* to_string(DirectiveAction action) {
    switch (action) {
        case DirectiveAction::DELETE: return "delete";
        case DirectiveAction::PROTECT: return "protect";
        case DirectiveAction::UNPROTECT: return "unprotect";
    }
    return "delete";
}

std::optional<DirectiveAction> parse_directive_action(const std::string& name) {
    auto lower = StringUtils::to_lower(StringUtils::trim(name));
    if (lower == "delete") return DirectiveAction::DELETE;
    if (lower == "protect") return DirectiveAction::PROTECT;
    if (lower == "unprotect") return DirectiveAction::UNPROTECT;
    return std::nullopt;
}

DirectiveFile::DirectiveFile(std::filesystem::path path)
    : path_(std::move(path)) {
}

DirectiveBatch DirectiveFile::consume() {
    if (path_.empty() || !FileUtils::exists(path_)) {
        return {};
    }
    
    auto claimed = path_;
    claimed += ".consumed";
    
    std::error_code ec;
    std::filesystem::rename(path_, claimed, ec);
    if (ec) {
        LOG_WARN("Cannot claim directive file {}: {}", path_.string(), ec.message());
        return {};
    }
    
    auto content = FileUtils::read_file(claimed);
    std::filesystem::remove(claimed, ec);
    if (ec) {
        LOG_WARN("Cannot remove consumed directive file {}: {}", claimed.string(), ec.message());
    }
    
    if (!content) {
        DirectiveBatch batch;
        batch.errors.push_back("cannot read " + claimed.string());
        return batch;
    }
    
    auto batch = parse(*content);
    for (const auto& error : batch.errors) {
        LOG_WARN("Directive file {}: {}", path_.string(), error);
    }
    LOG_INFO("Consumed {} directive(s) from {}", batch.directives.size(), path_.string());
    return batch;
}

DirectiveBatch DirectiveFile::parse(const std::string& content) {
    DirectiveBatch batch;
    auto text = StringUtils::trim(content);
    if (text.empty()) {
        return batch;
    }
    
    if (text.front() == '[') {
        Json::Value root;
        std::string error;
        if (!parse_json(text, root, error)) {
            batch.errors.push_back("malformed JSON array: " + StringUtils::trim(error));
            return batch;
        }
        for (const auto& entry : root) {
            parse_entry(entry, batch);
        }
        return batch;
    }
    
    size_t line_number = 0;
    for (const auto& raw : StringUtils::split(text, '\n')) {
        line_number++;
        auto line = StringUtils::trim(raw);
        if (line.empty()) {
            continue;
        }
        
        Json::Value entry;
        std::string error;
        if (!parse_json(line, entry, error)) {
            batch.errors.push_back("line " + std::to_string(line_number) + ": " + StringUtils::trim(error));
            continue;
        }
        parse_entry(entry, batch);
    }
    return batch;
}

std::string DirectiveFile::to_json(const Directive& directive) {
    return write_compact(to_value(directive));
}

// Always replaces the file through a temp file and rename, never appends in
// place: a daemon that has already renamed the old file aside cannot miss a
// directive written into it after it was read.
bool DirectiveFile::append(const Directive& directive) const {
    std::string content;
    auto existing = FileUtils::read_file(path_);
    if (existing) {
        auto text = StringUtils::trim(*existing);
        if (!text.empty() && text.front() == '[') {
            Json::Value root;
            std::string error;
            if (!parse_json(text, root, error) || !root.isArray()) {
                LOG_ERROR("Directive file {} is not a valid JSON array", path_.string());
                return false;
            }
            root.append(to_value(directive));
            
            Json::StreamWriterBuilder builder;
            builder["indentation"] = "  ";
            return FileUtils::write_file_atomic(path_, Json::writeString(builder, root) + "\n");
        }
        content = *existing;
        if (!content.empty() && content.back() != '\n') {
            content += '\n';
        }
    }
    content += to_json(directive) + "\n";
    return FileUtils::write_file_atomic(path_, content);
}

} // namespace seedkeeper::cleanup
