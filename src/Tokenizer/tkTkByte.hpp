// Created by Unium on 02.03.26

#pragma once

#include "../Util/utUtErr_.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace TK {
// ids 0..255 are the raw bytes, the reserved ids sit after them
// so decoding is never ambiguous
constexpr int32_t kPadId = 256;
constexpr int32_t kBosId = 257;
constexpr int32_t kEosId = 258;
constexpr int32_t kByteVocab = 259;

enum class EOverflow { Error, Truncate };

/*---------------------------------------------------------
 * FN: SUtf8State
 * DESC: incremental utf-8 validator (rfc 3629: no overlong
 *       forms, no surrogates, nothing past U+10FFFF). feed it
 *       one byte at a time
 * AUTH: unium (02.03.26)
 *-------------------------------------------------------*/
struct SUtf8State {
    int32_t iNeed = 0; // continuation bytes still owed
    uint8_t uLo = 0x80;
    uint8_t uHi = 0xBF;

    /*---------------------------------------------------------
     * FN: iSeqLen
     * DESC: total length of the sequence a lead byte opens,
     *       0 if the byte can never start a character
     * PARMS: uLead (first byte)
     * AUTH: unium (02.03.26)
     *-------------------------------------------------------*/
    static auto iSeqLen(uint8_t uLead) -> int32_t;

    auto bAllows(uint8_t uByte) const -> bool;

    // caller checks bAllows first
    void Push(uint8_t uByte);

    auto bAtBoundary() const -> bool { return iNeed == 0; }
};

/*---------------------------------------------------------
 * FN: lFindInvalidUtf8
 * DESC: offset of the first byte that breaks utf-8 in the
 *       span, -1 if the span is valid. a truncated trailing
 *       sequence reports the offset of its lead byte
 * PARMS: pData (bytes), lLen (length)
 * AUTH: unium (02.03.26)
 *-------------------------------------------------------*/
auto lFindInvalidUtf8(const uint8_t *pData, size_t lLen) -> int64_t;

class CByteTokenizer {
public:
    /*---------------------------------------------------------
     * FN: CByteTokenizer
     * DESC: byte level tokenizer, vocabulary is fixed at 259
     * PARMS: iMaxSeqLen (limit on encoded length incl specials),
     *        eOverflow (what to do past the limit)
     * AUTH: unium (02.03.26)
     *-------------------------------------------------------*/
    explicit CByteTokenizer(int32_t iMaxSeqLen = 4096, EOverflow eOverflow = EOverflow::Error);

    /*---------------------------------------------------------
     * FN: bEncode
     * DESC: text -> [bos] bytes [eos]. text must be valid utf-8.
     *       past iMaxSeqLen either fails or truncates the payload
     *       at a character boundary so the specials still fit
     * PARMS: szText (utf-8 text), viOut (ids out), sErr (status),
     *        bAddBos, bAddEos
     * AUTH: unium (02.03.26)
     *-------------------------------------------------------*/
    auto bEncode(const std::string &szText, std::vector<int32_t> &viOut, UT::SError &sErr, bool bAddBos = true,
                 bool bAddEos = true) const -> bool;

    /*---------------------------------------------------------
     * FN: bDecode
     * DESC: ids -> text. reserved ids are dropped, anything
     *       outside [0, 259) or a malformed byte run fails with
     *       the id index. never substitutes
     * PARMS: viIds (ids), szOut (text out), sErr (status)
     * AUTH: unium (02.03.26)
     *-------------------------------------------------------*/
    auto bDecode(const std::vector<int32_t> &viIds, std::string &szOut, UT::SError &sErr) const -> bool;

    auto iVocabSize() const -> int32_t { return kByteVocab; }
    auto iMaxSeqLen() const -> int32_t { return m_iMaxSeqLen; }
    auto eOverflow() const -> EOverflow { return m_eOverflow; }

    static auto bIsReserved(int32_t iId) -> bool { return iId >= kPadId && iId < kByteVocab; }

    // "<bos>", "'a'", "0xc3", for logs
    static auto szIdName(int32_t iId) -> std::string;

private:
    int32_t m_iMaxSeqLen;
    EOverflow m_eOverflow;
};
} // namespace TK
