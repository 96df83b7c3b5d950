#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace seedkeeper::cleanup {

enum class DirectiveAction {
    DELETE,
    PROTECT,
    UNPROTECT
};

const char* to_string(DirectiveAction action);
std::optional<DirectiveAction> parse_directive_action(const std::string& name);

struct Directive {
    DirectiveAction action = DirectiveAction::DELETE;
    std::string hash;
    std::string name_pattern;           // delete only; case-insensitive substring
    std::optional<bool> delete_files;   // falls back to cleanup_delete_files
    std::string reason;
};

struct DirectiveBatch {
    std::vector<Directive> directives;
    std::vector<std::string> errors;
};

// Manual directive file. Accepts a JSON array of objects or one JSON object
// per line. Each file is consumed exactly once: it is renamed aside before
// parsing and removed afterwards.
class DirectiveFile {
public:
    explicit DirectiveFile(std::filesystem::path path);
    
    // Empty batch when there is no file.
    DirectiveBatch consume();
    
    // Used by the operator CLI; keeps an existing array file an array.
    bool append(const Directive& directive) const;
    
    const std::filesystem::path& path() const { return path_; }
    
    static DirectiveBatch parse(const std::string& content);
    static std::string to_json(const Directive& directive);

private:
    std::filesystem::path path_;
};

} // namespace seedkeeper::cleanup
