// Created by Unium on 02.03.26

#include "utUtErr_.hpp"

namespace UT {
auto szErrorName(EError eCode) -> const char * {
    switch (eCode) {
    case EError::Ok:
        return "ok";
    case EError::Configuration:
        return "configuration";
    case EError::Encoding:
        return "encoding";
    case EError::Numerical:
        return "numerical";
    case EError::Internal:
        return "internal";
    }
    return "unknown";
}

auto SError::szFormat() const -> std::string { return std::string("[") + szErrorName(eCode) + "] " + szWhat; }

auto bFail(SError &sErr, EError eCode, const std::string &szWhat) -> bool {
    sErr.eCode = eCode;
    sErr.szWhat = szWhat;
    return false;
}
} // namespace UT
