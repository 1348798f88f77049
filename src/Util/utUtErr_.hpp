// Created by Unium on 02.03.26

#pragma once

#include <string>

namespace UT {
enum class EError {
    Ok,
    Configuration, // bad config value, layer index, patch bounds, checkpoint shape
    Encoding,      // malformed utf-8 or out of range id
    Numerical,     // nan / inf in hidden states or logits
    Internal       // broken invariant the caller could not have caused
};

/*---------------------------------------------------------
 * FN: szErrorName
 * DESC: short lower case name of an error kind for logs
 * PARMS: eCode (error kind)
 * AUTH: unium (02.03.26)
 *-------------------------------------------------------*/
auto szErrorName(EError eCode) -> const char *;

/*---------------------------------------------------------
 * FN: SError
 * DESC: status record filled by every fallible bXxx(...)
 *       call, szWhat names the parameter, position or
 *       tensor at fault
 * AUTH: unium (02.03.26)
 *-------------------------------------------------------*/
struct SError {
    EError eCode = EError::Ok;
    std::string szWhat;

    auto bOk() const -> bool { return eCode == EError::Ok; }
    void Clear() {
        eCode = EError::Ok;
        szWhat.clear();
    }

    // "[configuration] patch_size must be >= min_patch_size"
    auto szFormat() const -> std::string;
};

/*---------------------------------------------------------
 * FN: bFail
 * DESC: fills sErr and returns false so call sites can
 *       write `return bFail(...)`
 * PARMS: sErr (out), eCode (kind), szWhat (message)
 * AUTH: unium (02.03.26)
 *-------------------------------------------------------*/
auto bFail(SError &sErr, EError eCode, const std::string &szWhat) -> bool;
} // namespace UT
