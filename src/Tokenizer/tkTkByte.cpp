// Created by Unium on 02.03.26

#include "tkTkByte.hpp"

#include <cstdio>

namespace TK {

// <<<s_start(utf8)
// --- utf-8 validation
auto SUtf8State::iSeqLen(uint8_t uLead) -> int32_t {
    if (uLead < 0x80)
        return 1;
    if (uLead >= 0xC2 && uLead <= 0xDF)
        return 2;
    if (uLead >= 0xE0 && uLead <= 0xEF)
        return 3;
    if (uLead >= 0xF0 && uLead <= 0xF4)
        return 4;
    return 0;
}

auto SUtf8State::bAllows(uint8_t uByte) const -> bool {
    if (iNeed > 0)
        return uByte >= uLo && uByte <= uHi;
    return iSeqLen(uByte) > 0;
}

void SUtf8State::Push(uint8_t uByte) {
    if (iNeed > 0) {
        iNeed--;
        uLo = 0x80;
        uHi = 0xBF;
        return;
    }

    iNeed = iSeqLen(uByte) - 1;
    if (iNeed <= 0) {
        iNeed = 0;
        return;
    }

    // second byte ranges that rule out overlongs, surrogates and > U+10FFFF
    uLo = 0x80;
    uHi = 0xBF;
    if (uByte == 0xE0)
        uLo = 0xA0;
    else if (uByte == 0xED)
        uHi = 0x9F;
    else if (uByte == 0xF0)
        uLo = 0x90;
    else if (uByte == 0xF4)
        uHi = 0x8F;
}

auto lFindInvalidUtf8(const uint8_t *pData, size_t lLen) -> int64_t {
    SUtf8State sState;
    int64_t lLead = 0;
    for (size_t i = 0; i < lLen; i++) {
        if (!sState.bAllows(pData[i]))
            return (int64_t)i;
        if (sState.bAtBoundary())
            lLead = (int64_t)i;
        sState.Push(pData[i]);
    }
    return sState.bAtBoundary() ? -1 : lLead;
}
// >>>s_end(utf8)

CByteTokenizer::CByteTokenizer(int32_t iMaxSeqLen, EOverflow eOverflow)
    : m_iMaxSeqLen(iMaxSeqLen), m_eOverflow(eOverflow) {}

auto CByteTokenizer::szIdName(int32_t iId) -> std::string {
    if (iId == kPadId)
        return "<pad>";
    if (iId == kBosId)
        return "<bos>";
    if (iId == kEosId)
        return "<eos>";
    if (iId < 0 || iId >= kByteVocab)
        return "<invalid:" + std::to_string(iId) + ">";
    if (iId >= 0x20 && iId < 0x7F)
        return std::string("'") + (char)iId + "'";

    char szBuf[8];
    std::snprintf(szBuf, sizeof(szBuf), "0x%02x", iId);
    return szBuf;
}

auto CByteTokenizer::bEncode(const std::string &szText, std::vector<int32_t> &viOut, UT::SError &sErr, bool bAddBos,
                             bool bAddEos) const -> bool {
    viOut.clear();

    const auto *pBytes = reinterpret_cast<const uint8_t *>(szText.data());
    int64_t lBad = lFindInvalidUtf8(pBytes, szText.size());
    if (lBad >= 0) {
        return UT::bFail(sErr, UT::EError::Encoding,
                         "input is not valid utf-8 at byte offset " + std::to_string(lBad) + " (" +
                             szIdName(pBytes[lBad]) + ")");
    }

    const int64_t lSpecials = (bAddBos ? 1 : 0) + (bAddEos ? 1 : 0);
    if (m_iMaxSeqLen < lSpecials) {
        return UT::bFail(sErr, UT::EError::Configuration,
                         "max_seq_len " + std::to_string(m_iMaxSeqLen) + " cannot hold the bos/eos markers");
    }

    size_t lKeep = szText.size();
    const int64_t lTotal = (int64_t)lKeep + lSpecials;
    if (lTotal > m_iMaxSeqLen) {
        if (m_eOverflow == EOverflow::Error) {
            return UT::bFail(sErr, UT::EError::Configuration,
                             "encoded length " + std::to_string(lTotal) + " exceeds max_seq_len " +
                                 std::to_string(m_iMaxSeqLen));
        }

        // cut on a character boundary, the first dropped byte must not be a continuation
        lKeep = (size_t)(m_iMaxSeqLen - lSpecials);
        while (lKeep > 0 && (pBytes[lKeep] & 0xC0) == 0x80)
            lKeep--;
    }

    viOut.reserve(lKeep + lSpecials);
    if (bAddBos)
        viOut.push_back(kBosId);
    for (size_t i = 0; i < lKeep; i++)
        viOut.push_back((int32_t)pBytes[i]);
    if (bAddEos)
        viOut.push_back(kEosId);

    return true;
}

auto CByteTokenizer::bDecode(const std::vector<int32_t> &viIds, std::string &szOut, UT::SError &sErr) const -> bool {
    szOut.clear();
    szOut.reserve(viIds.size());

    SUtf8State sState;
    size_t lLeadIdx = 0;

    for (size_t i = 0; i < viIds.size(); i++) {
        int32_t iId = viIds[i];
        if (iId < 0 || iId >= kByteVocab) {
            return UT::bFail(sErr, UT::EError::Encoding,
                             "id " + std::to_string(iId) + " at index " + std::to_string(i) +
                                 " is outside the byte vocabulary");
        }
        if (bIsReserved(iId)) {
            if (!sState.bAtBoundary()) {
                return UT::bFail(sErr, UT::EError::Encoding,
                                 "reserved id " + szIdName(iId) + " at index " + std::to_string(i) +
                                     " splits a multi-byte character");
            }
            continue;
        }

        uint8_t uByte = (uint8_t)iId;
        if (!sState.bAllows(uByte)) {
            return UT::bFail(sErr, UT::EError::Encoding,
                             "malformed utf-8 at index " + std::to_string(i) + " (" + szIdName(iId) + ")");
        }
        if (sState.bAtBoundary())
            lLeadIdx = i;
        sState.Push(uByte);
        szOut += (char)uByte;
    }

    if (!sState.bAtBoundary()) {
        return UT::bFail(sErr, UT::EError::Encoding,
                         "truncated utf-8 sequence starting at index " + std::to_string(lLeadIdx));
    }
    return true;
}
} // namespace TK
