// Created by Unium on 24.02.26

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// flat json helpers. good enough for config.json, blt_config.json
// and safetensors headers, not a general parser
namespace UT {
/*---------------------------------------------------------
 * FN: szReadFileToString
 * DESC: reads a whole file into a str, empty on failure
 * PARMS: szPath (file path)
 * AUTH: unium (24.02.26)
 *-------------------------------------------------------*/
auto szReadFileToString(const std::string &szPath) -> std::string;

// <<<s_start(extract)
// --- key lookup, first match wins wherever it is nested
auto bHasJsonKey(const std::string &szJson, const std::string &szKey) -> bool;
auto szExtractJsonString(const std::string &szJson, const std::string &szKey, const std::string &szDefault = "")
    -> std::string;
auto iExtractJsonInt(const std::string &szJson, const std::string &szKey, int32_t iDefault = 0) -> int32_t;
auto fExtractJsonFloat(const std::string &szJson, const std::string &szKey, float fDefault = 0.0f) -> float;
auto bExtractJsonBool(const std::string &szJson, const std::string &szKey, bool bDefault = false) -> bool;

/*---------------------------------------------------------
 * FN: szExtractJsonArrayFirst
 * DESC: extracts the first string element from a json array
 *       ("architectures": ["Qwen2ForCausalLM"])
 * PARMS: szJson (json text), szKey (key name)
 * AUTH: unium (24.02.26)
 *-------------------------------------------------------*/
auto szExtractJsonArrayFirst(const std::string &szJson, const std::string &szKey) -> std::string;

/*---------------------------------------------------------
 * FN: viExtractJsonIntArray
 * DESC: extracts an array of integers for a given key.
 *       returns empty vector if key not found
 * PARMS: szJson (json text), szKey (key name)
 * AUTH: unium (24.02.26)
 *-------------------------------------------------------*/
auto viExtractJsonIntArray(const std::string &szJson, const std::string &szKey) -> std::vector<int32_t>;

/*---------------------------------------------------------
 * FN: vszExtractJsonStringArray
 * DESC: extracts an array of strings for a given key.
 *       returns empty vector if key not found
 * PARMS: szJson (json text), szKey (key name)
 * AUTH: unium (05.03.26)
 *-------------------------------------------------------*/
auto vszExtractJsonStringArray(const std::string &szJson, const std::string &szKey) -> std::vector<std::string>;
// >>>s_end(extract)

// <<<s_start(cursor)
// --- cursor level parsing, lPos is advanced past what was read
void SkipWs(const std::string &szJson, size_t &lPos);
void SkipJsonValue(const std::string &szJson, size_t &lPos);
auto szParseJsonString(const std::string &szJson, size_t &lPos) -> std::string;
auto lParseJsonNumber(const std::string &szJson, size_t &lPos) -> int64_t;
// >>>s_end(cursor)

/*---------------------------------------------------------
 * FN: szJsonEscape
 * DESC: quotes and escapes a string for json output
 * PARMS: szRaw (text)
 * AUTH: unium (06.03.26)
 *-------------------------------------------------------*/
auto szJsonEscape(const std::string &szRaw) -> std::string;
} // namespace UT
