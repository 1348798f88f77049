// Created by Unium on 24.02.26

#include "utUtJson.hpp"

#include <cstdlib>
#include <fstream>

namespace UT {

static auto bIsWs(char c) -> bool { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

/*---------------------------------------------------------
 * FN: lFindJsonValue
 * DESC: position of the first char of the value for szKey,
 *       npos if the key is missing or has no value
 * PARMS: szJson (json text), szKey (key name)
 * AUTH: unium (24.02.26 R: 05.03.26)
 *-------------------------------------------------------*/
static auto lFindJsonValue(const std::string &szJson, const std::string &szKey) -> size_t {
    std::string szSearch = "\"" + szKey + "\"";
    size_t lPos = szJson.find(szSearch);
    if (lPos == std::string::npos)
        return std::string::npos;

    lPos = szJson.find(':', lPos + szSearch.size());
    if (lPos == std::string::npos)
        return std::string::npos;
    lPos++;

    SkipWs(szJson, lPos);
    if (lPos >= szJson.size())
        return std::string::npos;
    return lPos;
}

auto szReadFileToString(const std::string &szPath) -> std::string {
    std::ifstream ifs(szPath, std::ios::binary | std::ios::ate);
    if (!ifs.is_open())
        return "";
    auto lSize = ifs.tellg();
    if (lSize <= 0)
        return "";
    ifs.seekg(0);
    std::string szBuf((size_t)lSize, '\0');
    ifs.read(&szBuf[0], lSize);
    return szBuf;
}

// <<<s_start(extract)
// --- key lookup
auto bHasJsonKey(const std::string &szJson, const std::string &szKey) -> bool {
    return lFindJsonValue(szJson, szKey) != std::string::npos;
}

auto szExtractJsonString(const std::string &szJson, const std::string &szKey, const std::string &szDefault)
    -> std::string {
    size_t lPos = lFindJsonValue(szJson, szKey);
    if (lPos == std::string::npos || szJson[lPos] != '"')
        return szDefault;
    return szParseJsonString(szJson, lPos);
}

auto iExtractJsonInt(const std::string &szJson, const std::string &szKey, int32_t iDefault) -> int32_t {
    size_t lPos = lFindJsonValue(szJson, szKey);
    if (lPos == std::string::npos)
        return iDefault;

    char c = szJson[lPos];
    if (c != '-' && (c < '0' || c > '9'))
        return iDefault;
    return (int32_t)lParseJsonNumber(szJson, lPos);
}

auto fExtractJsonFloat(const std::string &szJson, const std::string &szKey, float fDefault) -> float {
    size_t lPos = lFindJsonValue(szJson, szKey);
    if (lPos == std::string::npos)
        return fDefault;

    std::string szNum;
    while (lPos < szJson.size() &&
           (szJson[lPos] == '-' || szJson[lPos] == '.' || szJson[lPos] == 'e' || szJson[lPos] == 'E' ||
            szJson[lPos] == '+' || (szJson[lPos] >= '0' && szJson[lPos] <= '9')))
        szNum += szJson[lPos++];

    if (szNum.empty())
        return fDefault;
    char *pEnd = nullptr;
    float fVal = std::strtof(szNum.c_str(), &pEnd);
    return (pEnd == szNum.c_str()) ? fDefault : fVal;
}

auto bExtractJsonBool(const std::string &szJson, const std::string &szKey, bool bDefault) -> bool {
    size_t lPos = lFindJsonValue(szJson, szKey);
    if (lPos == std::string::npos)
        return bDefault;

    if (szJson.compare(lPos, 4, "true") == 0)
        return true;
    if (szJson.compare(lPos, 5, "false") == 0)
        return false;
    return bDefault;
}

auto szExtractJsonArrayFirst(const std::string &szJson, const std::string &szKey) -> std::string {
    auto vszAll = vszExtractJsonStringArray(szJson, szKey);
    return vszAll.empty() ? "" : vszAll[0];
}

auto viExtractJsonIntArray(const std::string &szJson, const std::string &szKey) -> std::vector<int32_t> {
    std::vector<int32_t> viResult;

    size_t lPos = lFindJsonValue(szJson, szKey);
    if (lPos == std::string::npos || szJson[lPos] != '[')
        return viResult;
    lPos++;

    while (lPos < szJson.size() && szJson[lPos] != ']') {
        while (lPos < szJson.size() && (bIsWs(szJson[lPos]) || szJson[lPos] == ','))
            lPos++;

        if (lPos >= szJson.size() || szJson[lPos] == ']')
            break;

        char c = szJson[lPos];
        if (c != '-' && (c < '0' || c > '9')) {
            // not an int array, give up rather than loop
            viResult.clear();
            return viResult;
        }
        viResult.push_back((int32_t)lParseJsonNumber(szJson, lPos));
    }

    return viResult;
}

auto vszExtractJsonStringArray(const std::string &szJson, const std::string &szKey) -> std::vector<std::string> {
    std::vector<std::string> vszResult;

    size_t lPos = lFindJsonValue(szJson, szKey);
    if (lPos == std::string::npos || szJson[lPos] != '[')
        return vszResult;
    lPos++;

    while (lPos < szJson.size() && szJson[lPos] != ']') {
        while (lPos < szJson.size() && (bIsWs(szJson[lPos]) || szJson[lPos] == ','))
            lPos++;

        if (lPos >= szJson.size() || szJson[lPos] == ']')
            break;

        if (szJson[lPos] != '"') {
            vszResult.clear();
            return vszResult;
        }
        vszResult.push_back(szParseJsonString(szJson, lPos));
    }

    return vszResult;
}
// >>>s_end(extract)

// <<<s_start(cursor)
// --- cursor level parsing
void SkipWs(const std::string &szJson, size_t &lPos) {
    while (lPos < szJson.size() && bIsWs(szJson[lPos]))
        lPos++;
}

auto lParseJsonNumber(const std::string &szJson, size_t &lPos) -> int64_t {
    bool bNeg = false;
    if (lPos < szJson.size() && szJson[lPos] == '-') {
        bNeg = true;
        lPos++;
    }
    int64_t lVal = 0;
    while (lPos < szJson.size() && szJson[lPos] >= '0' && szJson[lPos] <= '9')
        lVal = lVal * 10 + (szJson[lPos++] - '0');
    return bNeg ? -lVal : lVal;
}

auto szParseJsonString(const std::string &szJson, size_t &lPos) -> std::string {
    if (lPos >= szJson.size() || szJson[lPos] != '"')
        return "";
    lPos++;
    std::string szResult;
    while (lPos < szJson.size() && szJson[lPos] != '"') {
        if (szJson[lPos] == '\\' && lPos + 1 < szJson.size()) {
            lPos++;
            char c = szJson[lPos];
            if (c == 'n')
                szResult += '\n';
            else if (c == 't')
                szResult += '\t';
            else
                szResult += c;
        } else {
            szResult += szJson[lPos];
        }
        lPos++;
    }
    if (lPos < szJson.size())
        lPos++;
    return szResult;
}

/*---------------------------------------------------------
 * FN: SkipJsonValue
 * DESC: skips over any json value at position, strings
 *       inside objects/arrays are skipped whole so brackets
 *       in them do not count
 * PARMS: szJson, lPos (in/out)
 * AUTH: unium (24.02.26)
 *-------------------------------------------------------*/
void SkipJsonValue(const std::string &szJson, size_t &lPos) {
    SkipWs(szJson, lPos);
    if (lPos >= szJson.size())
        return;

    char c = szJson[lPos];
    if (c == '"') {
        szParseJsonString(szJson, lPos);
        return;
    }

    if (c == '{' || c == '[') {
        char cOpen = c;
        char cClose = (c == '{') ? '}' : ']';
        lPos++;
        int iDepth = 1;
        while (lPos < szJson.size() && iDepth > 0) {
            if (szJson[lPos] == '"') {
                szParseJsonString(szJson, lPos);
                continue;
            }
            if (szJson[lPos] == cOpen)
                iDepth++;
            else if (szJson[lPos] == cClose)
                iDepth--;
            lPos++;
        }
        return;
    }

    while (lPos < szJson.size() && szJson[lPos] != ',' && szJson[lPos] != '}' && szJson[lPos] != ']' &&
           !bIsWs(szJson[lPos]))
        lPos++;
}
// >>>s_end(cursor)

auto szJsonEscape(const std::string &szRaw) -> std::string {
    std::string szOut = "\"";
    for (char c : szRaw) {
        if (c == '"' || c == '\\') {
            szOut += '\\';
            szOut += c;
        } else if (c == '\n') {
            szOut += "\\n";
        } else if (c == '\t') {
            szOut += "\\t";
        } else {
            szOut += c;
        }
    }
    szOut += "\"";
    return szOut;
}
} // namespace UT
