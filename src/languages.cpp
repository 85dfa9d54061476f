#include "languages.h"

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;
#define X_RETURN_ARG5(cls, x, y, z, w, v, ...) case cls::x: return v;
#define X_RETURN_ARG6(cls, x, y, z, w, v, u, ...) case cls::x: return u;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageDefaultImage, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG4(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageSourceFile, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG5(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageRunCommand, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG6(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageInstallCommand, Language, ENUM_LANGUAGE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4
#undef X_RETURN_ARG5
#undef X_RETURN_ARG6

static const Language kLanguageTable[] = {
#define X(name, ...) Language::name,
  ENUM_LANGUAGE_
#undef X
};

std::optional<Language> GetLanguage(const std::string& name) {
  for (Language lang : kLanguageTable) {
    if (name == LanguageName(lang)) return lang;
  }
  return std::nullopt;
}

std::vector<std::string> AllLanguageNames() {
  std::vector<std::string> ret;
  for (Language lang : kLanguageTable) ret.push_back(LanguageName(lang));
  return ret;
}
