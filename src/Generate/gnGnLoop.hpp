// Created by Unium on 13.03.26

#pragma once

#include "../Latent/blLtModl.hpp"
#include "../Tokenizer/tkTkByte.hpp"
#include "../Util/utUtErr_.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace GN {
struct SGenConfig {
    int32_t iMaxNewBytes = 20;
    float fTemperature = 0.7f; // < 1e-6 is greedy
    int32_t iTopK = 50;        // <= 0 keeps every allowed id
    uint64_t uSeed = 1234;
    bool bKvCache = false;     // exact only with the closed patch mask
    bool bUtf8Constrain = true;
};

enum class EGenState { Start, Running, Stopped };

enum class EStepResult {
    Continue,
    Eos,
    MaxNewBytes,
    MaxSeqLen,
    Error
};

auto szStepResultName(EStepResult eResult) -> const char *;

/*---------------------------------------------------------
 * FN: CSampler
 * DESC: temperature + top k over a masked logit row, seeded
 *       xorshift64 so a run is reproducible
 * AUTH: unium (13.03.26)
 *-------------------------------------------------------*/
class CSampler {
public:
    explicit CSampler(uint64_t uSeed);

    /*---------------------------------------------------------
     * FN: iSample
     * DESC: picks one id among those with vbAllowed set. greedy
     *       takes the highest logit, lowest id on ties. -1 if
     *       nothing is allowed
     * PARMS: pfLogits (row of lVocab logits), vbAllowed (mask,
     *        lVocab long), fTemperature, iTopK
     * AUTH: unium (13.03.26)
     *-------------------------------------------------------*/
    auto iSample(const float *pfLogits, const std::vector<bool> &vbAllowed, float fTemperature, int32_t iTopK)
        -> int32_t;

    void Reseed(uint64_t uSeed);

private:
    // [0, 1)
    auto fRandFloat() -> float;

    uint64_t m_uState;
};

/*---------------------------------------------------------
 * FN: CGenerationState
 * DESC: one autoregressive decode. bStart loads the prompt,
 *       every eStep re-patches the whole buffer, runs the model
 *       and appends one byte until a stop reason comes up.
 *       the model must outlive the state and must not be shared
 *       with another generation while the kv cache is on
 * AUTH: unium (13.03.26)
 *-------------------------------------------------------*/
class CGenerationState {
public:
    CGenerationState(BL::CByteLatentModel &sModel, const SGenConfig &sCfg);

    /*---------------------------------------------------------
     * FN: bStart
     * DESC: takes the prompt ids (bos + bytes, no eos), checks
     *       the bytes are well formed and resets the kv cache.
     *       Start -> Running
     * PARMS: viPrompt (ids), sErr (status)
     * AUTH: unium (13.03.26)
     *-------------------------------------------------------*/
    auto bStart(const std::vector<int32_t> &viPrompt, UT::SError &sErr) -> bool;

    /*---------------------------------------------------------
     * FN: eStep
     * DESC: the single transition. Continue after appending a
     *       byte, a stop reason once Stopped. limits are checked
     *       before any compute so a full buffer costs nothing
     * PARMS: sErr (status, filled on Error)
     * AUTH: unium (13.03.26)
     *-------------------------------------------------------*/
    auto eStep(UT::SError &sErr) -> EStepResult;

    auto eState() const -> EGenState { return m_eState; }
    auto eStopReason() const -> EStepResult { return m_eStop; }
    auto viBuffer() const -> const std::vector<int32_t> & { return m_viBuffer; }
    auto viGenerated() const -> std::vector<int32_t>;
    auto iNumGenerated() const -> int32_t { return m_iGenerated; }
    auto iSteps() const -> int32_t { return m_iSteps; }

    // ids the next step may sample, given the current buffer
    auto vbAllowedIds() const -> std::vector<bool>;

private:
    auto eStop(EStepResult eReason) -> EStepResult;
    auto iRemainingBudget() const -> int32_t;

    BL::CByteLatentModel &m_sModel;
    SGenConfig m_sCfg;
    CSampler m_cSampler;

    EGenState m_eState = EGenState::Start;
    EStepResult m_eStop = EStepResult::Continue;
    std::vector<int32_t> m_viBuffer;
    size_t m_lPromptLen = 0;
    TK::SUtf8State m_sUtf8;
    int32_t m_iGenerated = 0;
    int32_t m_iSteps = 0;
};

struct SGenResult {
    std::vector<int32_t> viBytes; // generated ids, eos not included
    std::string szText;
    EStepResult eStop = EStepResult::Continue;
    int32_t iPromptLen = 0;
    double dTotalMs = 0.0;
    double dFirstMs = 0.0; // prompt pass + first byte
    double dBytesPerSec = 0.0;
};

/*---------------------------------------------------------
 * FN: bGenerate
 * DESC: prompt text -> generated text. encodes with bos and
 *       no eos, steps until stopped, decodes what was added.
 *       lfnOnByte, when set, sees every appended byte in order
 * PARMS: sModel, cTok (byte tokenizer), szPrompt (utf-8),
 *        sCfg (sampling), sResult (out), sErr (status),
 *        lfnOnByte (optional per byte callback)
 * AUTH: unium (13.03.26 R: 20.03.26)
 *-------------------------------------------------------*/
auto bGenerate(BL::CByteLatentModel &sModel, const TK::CByteTokenizer &cTok, const std::string &szPrompt,
               const SGenConfig &sCfg, SGenResult &sResult, UT::SError &sErr,
               const std::function<void(uint8_t)> &lfnOnByte = nullptr) -> bool;
} // namespace GN
