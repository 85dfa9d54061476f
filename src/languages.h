#ifndef LANGUAGES_H_
#define LANGUAGES_H_

#include <string>
#include <vector>
#include <optional>

// Commands are run with `sh -c` inside the session's working directory.
//  $SANDPOOL_LIBS holds the space-separated library names during installation.
#define ENUM_LANGUAGE_ \
  X(PYTHON, "python", "python:3.11-slim-bullseye", "main.py", \
    "python3 main.py", \
    "pip install --quiet --disable-pip-version-check $SANDPOOL_LIBS") \
  X(JAVASCRIPT, "javascript", "node:22-bullseye-slim", "main.js", \
    "node main.js", \
    "npm install --silent --no-audit --no-fund $SANDPOOL_LIBS") \
  X(JAVA, "java", "eclipse-temurin:17-jdk", "Main.java", \
    "javac Main.java && java Main", \
    "") \
  X(CPP, "cpp", "gcc:13-bookworm", "main.cpp", \
    "g++ -std=c++17 -O2 -o main main.cpp && ./main", \
    "apt-get update -qq && apt-get install -y -qq $SANDPOOL_LIBS") \
  X(GO, "go", "golang:1.22-bookworm", "main.go", \
    "{ [ -f go.mod ] || go mod init sandbox >/dev/null 2>&1; } && go run main.go", \
    "{ [ -f go.mod ] || go mod init sandbox >/dev/null 2>&1; } && go get $SANDPOOL_LIBS") \
  X(R, "r", "r-base:4.3.2", "main.R", \
    "Rscript main.R", \
    "for p in $SANDPOOL_LIBS; do " \
    "Rscript -e \"install.packages('$p', repos='https://cloud.r-project.org')\" || exit 1; done")
enum class Language {
#define X(name, ...) name,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageName(Language);
const char* LanguageDefaultImage(Language);
const char* LanguageSourceFile(Language);
const char* LanguageRunCommand(Language);
// empty if the language has no package manager support
const char* LanguageInstallCommand(Language);
std::optional<Language> GetLanguage(const std::string& name);
// names of all known languages, in declaration order
std::vector<std::string> AllLanguageNames();

#endif  // LANGUAGES_H_
