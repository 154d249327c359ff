#ifndef INCLUDE_CODEGRADE_LANGUAGE_H_
#define INCLUDE_CODEGRADE_LANGUAGE_H_

#include <string>
#include <vector>
#include <optional>

#define ENUM_LANGUAGE_ \
  X(PYTHON, "python", ".py") \
  X(JAVASCRIPT, "javascript", ".js") \
  X(JAVA, "java", ".java") \
  X(CPP, "cpp", ".cpp") \
  X(C, "c", ".c") \
  X(GO, "go", ".go") \
  X(RUST, "rust", ".rs") \
  X(RUBY, "ruby", ".rb") \
  X(PHP, "php", ".php") \
  X(CSHARP, "csharp", ".cs")
enum class Language {
#define X(name, str, ext) name,
  ENUM_LANGUAGE_
#undef X
};

// How the test input reaches user code
#define ENUM_HARNESS_TYPE_ \
  X(FUNCTION_CALL) /* generated runner calls a user function with the parsed input */ \
  X(RAW_STDIN) /* program reads the input from stdin itself */
enum class HarnessType {
#define X(name) name,
  ENUM_HARNESS_TYPE_
#undef X
};

struct LanguageSpec {
  Language language;
  std::string name;
  std::string extension;
  // Command templates, split on spaces after substitution of
  //   {source} {binary} {dir} {main_class}
  // An empty compile command means interpreted; an empty run command means
  //   the language can only be judged remotely.
  std::string compile_command;
  std::string run_command;
  long default_time_limit_ms;
  long default_memory_limit_mb;
  HarnessType harness;

  bool IsCompiled() const { return !compile_command.empty(); }
  bool IsLocallySupported() const { return !run_command.empty(); }
};

// Read-only after construction; shared by every concurrent work unit.
class LanguageTable {
  std::vector<LanguageSpec> specs_;
 public:
  LanguageTable();
  explicit LanguageTable(std::vector<LanguageSpec>&& specs) : specs_(std::move(specs)) {}

  const LanguageSpec* Find(Language) const;
  const LanguageSpec* Find(const std::string& name) const;
  const std::vector<LanguageSpec>& Specs() const { return specs_; }
};

const char* LanguageName(Language);
std::optional<Language> GetLanguage(const std::string&);
std::vector<LanguageSpec> DefaultLanguageSpecs();

#endif  // INCLUDE_CODEGRADE_LANGUAGE_H_
