#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>

struct ImportIR;

enum class ModuleFormat {
    ESM,
    COMMONJS
};

const char* module_format_name(ModuleFormat format);
bool parse_module_format(const std::string& text, ModuleFormat& out);

// Deduplicating collection of imports keyed by module source. Generation is
// deterministic: the same registry state always yields the same text.
class ImportRegistry {
public:
    void add_named(const std::string& source, const std::string& imported, const std::string& local = "",
                   bool is_type = false);
    void add_default(const std::string& source, const std::string& local);
    void add_namespace(const std::string& source, const std::string& local);
    void add_side_effect(const std::string& source);

    // Merge a user import statement
    void add(const ImportIR& decl);

    bool has(const std::string& source, const std::string& imported) const;
    bool empty() const { return modules.empty(); }
    size_t module_count() const { return modules.size(); }
    void clear() { modules.clear(); }

    // One line per statement, each ending in '\n'. Side-effect-only modules
    // come first, then modules sorted by source.
    std::string generate(ModuleFormat format = ModuleFormat::ESM) const;

private:
    using Binding = std::pair<std::string, std::string>;    // imported, local

    struct ModuleImports {
        std::string default_name;
        std::set<std::string> namespaces;
        std::set<Binding> values;
        std::set<Binding> types;
        std::string type_default;
    };

    std::map<std::string, ModuleImports> modules;

    static bool is_side_effect_only(const ModuleImports& imports);
    static std::string format_bindings(const std::set<Binding>& bindings, const char* separator);
    void generate_esm(std::string& out, const std::string& source, const ModuleImports& imports) const;
    void generate_commonjs(std::string& out, const std::string& source, const ModuleImports& imports) const;
};
