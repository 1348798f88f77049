// Created by Unium on 14.03.26

#pragma once

#include "../Generate/gnGnLoop.hpp"
#include "../Latent/blLtModl.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include "../Tokenizer/tkTkByte.hpp"
#include "tsTsFixt.hpp"
#include "tsTsTstf.hpp"

#include <memory>
#include <string>
#include <vector>

static auto pTinyModel(uint32_t uSeed) -> std::unique_ptr<BL::CByteLatentModel> {
    auto pModel = std::make_unique<BL::CByteLatentModel>();
    UT::SError sErr;
    Check(pModel->bBuild(sTinyConfig(), uSeed, sErr), sErr.szFormat());
    return pModel;
}

static auto sGreedy(int32_t iMaxNew) -> GN::SGenConfig {
    GN::SGenConfig sCfg;
    sCfg.fTemperature = 0.0f;
    sCfg.iMaxNewBytes = iMaxNew;
    return sCfg;
}

// <<<s_start(sampler)
// --- sampler
TEST(sampler_greedy_lowest_on_tie) {
    GN::CSampler cSampler(1);
    std::vector<float> vfLogits(259, 0.5f);
    std::vector<bool> vbAll(259, true);
    Check(cSampler.iSample(vfLogits.data(), vbAll, 0.0f, 0) == 0, "all equal, id 0");

    vbAll[0] = false;
    Check(cSampler.iSample(vfLogits.data(), vbAll, 0.0f, 0) == 1, "masked id 0, id 1");

    vfLogits[200] = 3.0f;
    Check(cSampler.iSample(vfLogits.data(), vbAll, 0.0f, 0) == 200, "argmax");
    vbAll[200] = false;
    Check(cSampler.iSample(vfLogits.data(), vbAll, 0.0f, 0) != 200, "masked argmax is skipped");
}

TEST(sampler_respects_mask) {
    GN::CSampler cSampler(99);
    std::vector<float> vfLogits(259, 0.0f);
    vfLogits[5] = 50.0f; // would win every draw if it were allowed
    std::vector<bool> vbAllowed(259, false);
    for (int32_t i = 'a'; i <= 'z'; i++)
        vbAllowed[i] = true;

    for (int iDraw = 0; iDraw < 500; iDraw++) {
        int32_t iId = cSampler.iSample(vfLogits.data(), vbAllowed, 1.0f, 0);
        Check(iId >= 'a' && iId <= 'z', "only allowed ids");
    }

    std::vector<bool> vbNone(259, false);
    Check(cSampler.iSample(vfLogits.data(), vbNone, 1.0f, 10) == -1, "nothing allowed");
}

TEST(sampler_seeded_and_top_k) {
    std::vector<float> vfLogits(259);
    for (int32_t i = 0; i < 259; i++)
        vfLogits[i] = (float)(i % 17) * 0.1f;
    std::vector<bool> vbAll(259, true);

    GN::CSampler cA(7), cB(7);
    for (int iDraw = 0; iDraw < 100; iDraw++)
        Check(cA.iSample(vfLogits.data(), vbAll, 0.8f, 20) == cB.iSample(vfLogits.data(), vbAll, 0.8f, 20),
              "same seed, same draws");

    // logit 1.6 sits at ids 16, 33, ... top 1 is the lowest of them
    GN::CSampler cTop(3);
    for (int iDraw = 0; iDraw < 20; iDraw++)
        Check(cTop.iSample(vfLogits.data(), vbAll, 1.0f, 1) == 16, "top 1 is greedy");

    GN::CSampler cZero(0);
    Check(cZero.iSample(vfLogits.data(), vbAll, 1.0f, 0) >= 0, "seed 0 still draws");
}
// >>>s_end(sampler)

// <<<s_start(state)
// --- state machine
TEST(gen_step_before_start) {
    auto pModel = pTinyModel(5);
    GN::CGenerationState sState(*pModel, sGreedy(4));
    Check(sState.eState() == GN::EGenState::Start, "starts in Start");

    UT::SError sErr;
    Check(sState.eStep(sErr) == GN::EStepResult::Error, "no prompt yet");
    Check(sErr.eCode == UT::EError::Internal, "internal error");
    Check(sState.eState() == GN::EGenState::Stopped, "stopped");
    Check(sState.eStep(sErr) == GN::EStepResult::Error, "stays stopped");
}

TEST(gen_start_rejects) {
    auto pModel = pTinyModel(5);
    UT::SError sErr;
    {
        GN::CGenerationState sState(*pModel, sGreedy(4));
        Check(!sState.bStart({}, sErr), "empty prompt");
        Check(sErr.eCode == UT::EError::Configuration, "configuration error");
    }
    {
        GN::CGenerationState sState(*pModel, sGreedy(4));
        Check(!sState.bStart({TK::kBosId, 0xFF}, sErr), "0xff");
        Check(sErr.eCode == UT::EError::Encoding, "encoding error");
    }
    {
        GN::CGenerationState sState(*pModel, sGreedy(4));
        Check(!sState.bStart({TK::kBosId, 0x80}, sErr), "stray continuation byte");
        Check(!sState.bStart({TK::kBosId, 300}, sErr), "id past the vocabulary");
    }
    {
        GN::CGenerationState sState(*pModel, sGreedy(-1));
        Check(!sState.bStart({TK::kBosId}, sErr), "negative budget");
    }
    {
        GN::CGenerationState sState(*pModel, sGreedy(4));
        Check(sState.bStart({TK::kBosId, 'a'}, sErr), "start");
        Check(!sState.bStart({TK::kBosId, 'a'}, sErr), "twice");
        Check(sErr.eCode == UT::EError::Internal, "internal error");
    }
    {
        BL::CByteLatentModel cCold;
        GN::CGenerationState sState(cCold, sGreedy(4));
        Check(!sState.bStart({TK::kBosId}, sErr), "unbuilt model");
    }
}

TEST(gen_allowed_ids) {
    auto pModel = pTinyModel(5);
    UT::SError sErr;

    GN::CGenerationState sBoundary(*pModel, sGreedy(1));
    Check(sBoundary.bStart({TK::kBosId, 'h', 'i'}, sErr), "start");
    auto vbAllowed = sBoundary.vbAllowedIds();
    Check(vbAllowed.size() == 259, "one flag per id");
    Check(!vbAllowed[TK::kPadId] && !vbAllowed[TK::kBosId], "pad and bos never");
    Check(vbAllowed[TK::kEosId], "eos at a character boundary");
    Check(vbAllowed['x'], "ascii");
    Check(!vbAllowed[0xC3] && !vbAllowed[0xE2], "a one byte budget leaves no room for a lead byte");
    Check(!vbAllowed[0x80], "no continuation at a boundary");

    // a prompt that stops inside "€" (e2 82 ac)
    GN::CGenerationState sInside(*pModel, sGreedy(8));
    Check(sInside.bStart({TK::kBosId, 0xE2, 0x82}, sErr), "start");
    vbAllowed = sInside.vbAllowedIds();
    Check(!vbAllowed[TK::kEosId], "no eos inside a character");
    Check(!vbAllowed['x'], "no ascii inside a character");
    Check(vbAllowed[0xAC], "the continuation");

    auto sFree = sGreedy(1);
    sFree.bUtf8Constrain = false;
    GN::CGenerationState sUnconstrained(*pModel, sFree);
    Check(sUnconstrained.bStart({TK::kBosId, 0xE2}, sErr), "start");
    vbAllowed = sUnconstrained.vbAllowedIds();
    Check(vbAllowed['x'] && vbAllowed[0xFF] && vbAllowed[TK::kEosId], "every byte and eos");
    Check(!vbAllowed[TK::kBosId], "still no bos");
}

TEST(gen_limits) {
    auto pModel = pTinyModel(6);
    UT::SError sErr;

    GN::CGenerationState sNone(*pModel, sGreedy(0));
    Check(sNone.bStart({TK::kBosId, 'a'}, sErr), "start");
    Check(sNone.eStep(sErr) == GN::EStepResult::MaxNewBytes, "zero budget");
    Check(sNone.iSteps() == 0, "stopped before any compute");
    Check(sNone.eStopReason() == GN::EStepResult::MaxNewBytes, "reason kept");

    std::vector<int32_t> viFull(256, 'a');
    viFull[0] = TK::kBosId;
    GN::CGenerationState sFull(*pModel, sGreedy(20));
    Check(sFull.bStart(viFull, sErr), "prompt at max_seq_len");
    Check(sFull.eStep(sErr) == GN::EStepResult::MaxSeqLen, "no room");

    viFull.pop_back();
    GN::CGenerationState sLast(*pModel, sGreedy(20));
    Check(sLast.bStart(viFull, sErr), "one slot left");
    GN::EStepResult eResult = GN::EStepResult::Continue;
    while (eResult == GN::EStepResult::Continue)
        eResult = sLast.eStep(sErr);
    Check(eResult == GN::EStepResult::MaxSeqLen || eResult == GN::EStepResult::Eos, "stops at the limit");
    Check(sLast.viBuffer().size() <= 256, "never past max_seq_len");
    Check(sLast.iNumGenerated() <= 1, "at most the one slot");
}

// points the byte head at the final hidden row so eos is the only nonzero logit
static void AimHeadAtEos(BL::CByteLatentModel &cModel, const std::vector<int32_t> &viIds) {
    auto &cReg = cModel.sRegistry();
    CTensor tH = OP::GatherRows(*cReg.psFind("tok_embeddings.weight")->ptTensor, viIds);
    for (int32_t i = 0; i < cModel.iNumLayers(); i++)
        tH = cModel.pDecoderBlock(i)->Apply(tH, 0);
    auto tNormed = OP::RmsNorm(tH, *cReg.psFind("norm.scale")->ptTensor, cModel.sConfig().sDecoder.fRmsEps);

    CTensor &tHead = *cReg.psFind("output.weight")->ptTensor;
    OP::FillInplace(tHead, 0.0f);
    for (int64_t d = 0; d < tHead.lCols(); d++)
        tHead.fAt({TK::kEosId, d}) = tNormed.fAt({tNormed.lRows() - 1, d});
}

TEST(gen_stops_on_eos) {
    auto pModel = pTinyModel(12);
    const std::vector<int32_t> viPrompt = {TK::kBosId, 'h', 'i'};
    AimHeadAtEos(*pModel, viPrompt);

    UT::SError sErr;
    GN::CGenerationState sState(*pModel, sGreedy(8));
    Check(sState.bStart(viPrompt, sErr), "start");
    Check(sState.eStep(sErr) == GN::EStepResult::Eos, sErr.szFormat());
    Check(sState.eState() == GN::EGenState::Stopped, "stopped");
    Check(sState.iNumGenerated() == 0, "nothing generated");
    Check(sState.viBuffer() == viPrompt, "eos is not appended");
    Check(sState.iSteps() == 1, "one forward pass");
    Check(sState.eStep(sErr) == GN::EStepResult::Eos && sState.iSteps() == 1, "stopped states stay put");

    TK::CByteTokenizer cTok(256);
    GN::SGenResult sResult;
    int32_t iCalls = 0;
    Check(GN::bGenerate(*pModel, cTok, "hi", sGreedy(8), sResult, sErr, [&](uint8_t) { iCalls++; }),
          sErr.szFormat());
    Check(sResult.eStop == GN::EStepResult::Eos, "driver reports eos");
    Check(sResult.viBytes.empty() && sResult.szText.empty(), "empty result");
    Check(iCalls == 0, "no bytes streamed");
}

TEST(gen_budget_stops_on_boundary) {
    auto pModel = pTinyModel(8);
    auto sCfg = sGreedy(5);
    sCfg.fTemperature = 1.5f;
    sCfg.iTopK = 0;
    UT::SError sErr;

    for (uint64_t uSeed = 1; uSeed <= 4; uSeed++) {
        sCfg.uSeed = uSeed;
        GN::CGenerationState sState(*pModel, sCfg);
        Check(sState.bStart({TK::kBosId, 'o', 'k'}, sErr), "start");
        GN::EStepResult eResult = GN::EStepResult::Continue;
        while (eResult == GN::EStepResult::Continue)
            eResult = sState.eStep(sErr);
        Check(eResult != GN::EStepResult::Error, sErr.szFormat());
        Check(sState.iNumGenerated() <= 5, "budget");
        std::vector<uint8_t> vuBytes;
        for (int32_t iId : sState.viGenerated())
            vuBytes.push_back((uint8_t)iId);
        Check(TK::lFindInvalidUtf8(vuBytes.data(), vuBytes.size()) < 0, "whole characters only");
    }
}
// >>>s_end(state)

// <<<s_start(generate)
// --- end to end
TEST(gen_greedy_deterministic) {
    auto pModel = pTinyModel(9);
    TK::CByteTokenizer cTok(256);
    GN::SGenResult sA, sB;
    UT::SError sErr;
    Check(GN::bGenerate(*pModel, cTok, "abc", sGreedy(12), sA, sErr), sErr.szFormat());
    Check(GN::bGenerate(*pModel, cTok, "abc", sGreedy(12), sB, sErr), sErr.szFormat());
    Check(sA.viBytes == sB.viBytes, "same bytes");
    Check(sA.szText == sB.szText, "same text");
    Check(sA.iPromptLen == 4, "bos + 3 bytes");
}

TEST(gen_streams_every_byte) {
    auto pModel = pTinyModel(9);
    TK::CByteTokenizer cTok(256);
    GN::SGenResult sResult;
    UT::SError sErr;
    std::vector<int32_t> viSeen;
    Check(GN::bGenerate(*pModel, cTok, "abc", sGreedy(12), sResult, sErr,
                        [&](uint8_t uByte) { viSeen.push_back(uByte); }),
          sErr.szFormat());
    Check(viSeen == sResult.viBytes, "callback sees the generated bytes in order");
}

TEST(gen_cached_matches_uncached) {
    auto pModel = pTinyModel(10);
    SetGates(*pModel, 0.7f);
    TK::CByteTokenizer cTok(256);
    auto sCfg = sGreedy(16);
    GN::SGenResult sPlain, sCached;
    UT::SError sErr;

    Check(GN::bGenerate(*pModel, cTok, "kv cache check", sCfg, sPlain, sErr), sErr.szFormat());
    sCfg.bKvCache = true;
    Check(GN::bGenerate(*pModel, cTok, "kv cache check", sCfg, sCached, sErr), sErr.szFormat());
    Check(pModel->bKvCacheEnabled(), "cache was switched on");
    Check(sPlain.viBytes == sCached.viBytes, "cache does not change greedy output");
    Check(sPlain.eStop == sCached.eStop, "same stop reason");
}

TEST(gen_cats_story) {
    auto pModel = pTinyModel(42);
    TK::CByteTokenizer cTok(256);
    const std::string szPrompt = "Below is an instruction that describes a task. Write a response that appropriately "
                                 "completes the request.\n\n### Instruction:\nTell me about cats\n\n### Response:\n\n";
    GN::SGenConfig sCfg;
    sCfg.iMaxNewBytes = 20;
    sCfg.fTemperature = 0.7f;
    sCfg.iTopK = 50;
    GN::SGenResult sResult;
    UT::SError sErr;
    Check(GN::bGenerate(*pModel, cTok, szPrompt, sCfg, sResult, sErr), sErr.szFormat());

    Check(sResult.iPromptLen == (int32_t)szPrompt.size() + 1, "bos + prompt bytes");
    Check(sResult.viBytes.size() <= 20, "at most 20 new bytes");
    Check(!sResult.viBytes.empty() || sResult.eStop == GN::EStepResult::Eos, "bytes or an early eos");
    Check(sResult.eStop == GN::EStepResult::Eos || sResult.eStop == GN::EStepResult::MaxNewBytes, "stop reason");
    Check(sResult.szText.size() == sResult.viBytes.size(), "decoded text is the bytes");
    Check(TK::lFindInvalidUtf8(reinterpret_cast<const uint8_t *>(sResult.szText.data()), sResult.szText.size()) < 0,
          "valid utf-8");
    Check(sResult.dTotalMs >= sResult.dFirstMs, "timing");
}

TEST(gen_rejects_malformed_text) {
    auto pModel = pTinyModel(11);
    TK::CByteTokenizer cTok(256);
    GN::SGenResult sResult;
    UT::SError sErr;
    Check(!GN::bGenerate(*pModel, cTok, "bad \xFF byte", sGreedy(4), sResult, sErr), "rejected");
    Check(sErr.eCode == UT::EError::Encoding, "encoding error");
    Check(std::string(GN::szStepResultName(GN::EStepResult::MaxSeqLen)) == "max_seq_len", "names");
}
// >>>s_end(generate)
