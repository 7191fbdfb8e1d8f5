#include "language/language.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <map>

namespace sandbox {
using namespace std;

static const map<language, string> language_names = boost::assign::map_list_of
    (language::PYTHON, "python")
    (language::JAVASCRIPT, "javascript")
    (language::JAVA, "java")
    (language::C, "c")
    (language::CPP, "cpp");

optional<language> parse_language(const string &name) {
    string lower = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    for (auto &[lang, lang_name] : language_names)
        if (lang_name == lower) return lang;
    return nullopt;
}

string to_string(language lang) {
    return language_names.at(lang);
}

const vector<language> &supported_languages() {
    static const vector<language> languages = {
        language::PYTHON, language::JAVASCRIPT, language::JAVA, language::C, language::CPP};
    return languages;
}

string supported_language_list() {
    vector<string> names;
    for (language lang : supported_languages())
        names.push_back(to_string(lang));
    return boost::algorithm::join(names, ", ");
}

}  // namespace sandbox
