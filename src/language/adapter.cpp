#include "language/adapter.hpp"
#include <map>
#include <memory>
#include "language/c_family.hpp"
#include "language/java.hpp"
#include "language/javascript.hpp"
#include "language/python.hpp"

namespace sandbox {
using namespace std;

optional<vector<string>> language_adapter::compile_command(const filesystem::path &, const filesystem::path &) const {
    return nullopt;
}

string language_adapter::wrap_source(const string &code) const {
    return code;
}

static map<language, unique_ptr<language_adapter>> make_registry() {
    map<language, unique_ptr<language_adapter>> registry;
    registry[language::PYTHON] = make_unique<python_adapter>();
    registry[language::JAVASCRIPT] = make_unique<javascript_adapter>();
    registry[language::JAVA] = make_unique<java_adapter>();
    registry[language::C] = make_unique<c_family_adapter>(false);
    registry[language::CPP] = make_unique<c_family_adapter>(true);
    return registry;
}

const language_adapter &get_adapter(language lang) {
    static const map<language, unique_ptr<language_adapter>> registry = make_registry();
    return *registry.at(lang);
}

}  // namespace sandbox
