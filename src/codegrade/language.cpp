#include <codegrade/language.h>

#include <algorithm>

std::vector<LanguageSpec> DefaultLanguageSpecs() {
  return {
    {Language::PYTHON, "python", ".py", "", "python3 {source}", 10000, 128, HarnessType::FUNCTION_CALL},
    {Language::JAVASCRIPT, "javascript", ".js", "", "node {source}", 10000, 128, HarnessType::FUNCTION_CALL},
    {Language::JAVA, "java", ".java", "javac -encoding UTF-8 -d {dir} {source}",
      "java -Xss64m -cp {dir} {main_class}", 15000, 256, HarnessType::RAW_STDIN},
    {Language::CPP, "cpp", ".cpp", "g++ -O2 -std=c++17 -o {binary} {source}", "{binary}",
      15000, 256, HarnessType::RAW_STDIN},
    {Language::C, "c", ".c", "gcc -O2 -std=c11 -o {binary} {source} -lm", "{binary}",
      15000, 256, HarnessType::RAW_STDIN},
    {Language::GO, "go", ".go", "go build -o {binary} {source}", "{binary}",
      10000, 128, HarnessType::RAW_STDIN},
    {Language::RUST, "rust", ".rs", "rustc -O -o {binary} {source}", "{binary}",
      15000, 256, HarnessType::RAW_STDIN},
    {Language::RUBY, "ruby", ".rb", "", "ruby {source}", 10000, 128, HarnessType::RAW_STDIN},
    {Language::PHP, "php", ".php", "", "php {source}", 10000, 128, HarnessType::RAW_STDIN},
    // judged remotely only
    {Language::CSHARP, "csharp", ".cs", "", "", 15000, 256, HarnessType::RAW_STDIN},
  };
}

LanguageTable::LanguageTable() : specs_(DefaultLanguageSpecs()) {}

const LanguageSpec* LanguageTable::Find(Language lang) const {
  auto it = std::find_if(specs_.begin(), specs_.end(),
      [lang](const LanguageSpec& spec) { return spec.language == lang; });
  return it == specs_.end() ? nullptr : &*it;
}

const LanguageSpec* LanguageTable::Find(const std::string& name) const {
  auto lang = GetLanguage(name);
  if (!lang) return nullptr;
  return Find(*lang);
}

std::optional<Language> GetLanguage(const std::string& str) {
  std::string name = str;
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c;
  });
#define X(val, lname, ext) if (name == lname) return Language::val;
  ENUM_LANGUAGE_
#undef X
  if (name == "python3" || name == "py") return Language::PYTHON;
  if (name == "js" || name == "node") return Language::JAVASCRIPT;
  if (name == "c++" || name == "cxx") return Language::CPP;
  if (name == "golang") return Language::GO;
  if (name == "c#" || name == "cs") return Language::CSHARP;
  return std::nullopt;
}
