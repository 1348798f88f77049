// Created by Unium on 06.03.26

#include "blLtConf.hpp"
#include "../Util/utUtJson.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace BL {

auto SLocalEncoderConfig::sBlockConfig() const -> MD::SBlockConfig {
    MD::SBlockConfig sBlk;
    sBlk.iDim = iDim;
    sBlk.iNHeads = iNHeads;
    sBlk.iNKvHeads = iNKvHeads;
    sBlk.iHeadDim = iHeadDim();
    sBlk.iHiddenDim = iHiddenDim;
    sBlk.fRmsEps = fRmsEps;
    sBlk.fRopeTheta = fRopeTheta;
    sBlk.iWindow = iWindow;
    sBlk.bQkvBias = true;
    return sBlk;
}

// <<<s_start(names)
// --- enum names
auto bParseEntropyMode(const std::string &szName, EEntropyMode &eOut) -> bool {
    if (szName == "histogram")
        eOut = EEntropyMode::Histogram;
    else if (szName == "predictor")
        eOut = EEntropyMode::Predictor;
    else
        return false;
    return true;
}

auto bParseThresholdMode(const std::string &szName, EThresholdMode &eOut) -> bool {
    if (szName == "fixed")
        eOut = EThresholdMode::Fixed;
    else if (szName == "adaptive")
        eOut = EThresholdMode::Adaptive;
    else
        return false;
    return true;
}

auto bParsePoolMode(const std::string &szName, EPoolMode &eOut) -> bool {
    if (szName == "mean")
        eOut = EPoolMode::Mean;
    else if (szName == "last")
        eOut = EPoolMode::Last;
    else if (szName == "max")
        eOut = EPoolMode::Max;
    else
        return false;
    return true;
}

auto bParsePatchMask(const std::string &szName, EPatchMask &eOut) -> bool {
    if (szName == "closed")
        eOut = EPatchMask::Closed;
    else if (szName == "none")
        eOut = EPatchMask::None;
    else
        return false;
    return true;
}

auto szEntropyModeName(EEntropyMode eMode) -> const char * {
    return eMode == EEntropyMode::Histogram ? "histogram" : "predictor";
}

auto szThresholdModeName(EThresholdMode eMode) -> const char * {
    return eMode == EThresholdMode::Fixed ? "fixed" : "adaptive";
}

auto szPoolModeName(EPoolMode eMode) -> const char * {
    switch (eMode) {
    case EPoolMode::Mean:
        return "mean";
    case EPoolMode::Last:
        return "last";
    case EPoolMode::Max:
        return "max";
    }
    return "?";
}

auto szPatchMaskName(EPatchMask eMask) -> const char * { return eMask == EPatchMask::Closed ? "closed" : "none"; }
// >>>s_end(names)

auto bValidatePatcherConfig(const SPatcherConfig &sCfg, UT::SError &sErr) -> bool {
    auto bBad = [&](const std::string &szWhat) { return UT::bFail(sErr, UT::EError::Configuration, szWhat); };

    if (sCfg.iMinPatch < 1)
        return bBad("min_patch_size must be >= 1, got " + std::to_string(sCfg.iMinPatch));
    if (sCfg.iMinPatch > sCfg.iMaxPatch)
        return bBad("min_patch_size " + std::to_string(sCfg.iMinPatch) + " > patch_size " +
                    std::to_string(sCfg.iMaxPatch));
    if (sCfg.iWindow < 1)
        return bBad("entropy_window must be >= 1, got " + std::to_string(sCfg.iWindow));
    if (sCfg.fMinThreshold > sCfg.fMaxThreshold)
        return bBad("min_threshold > max_threshold");
    if (sCfg.fStepUp < 0.0f || sCfg.fStepDown < 0.0f)
        return bBad("threshold steps must be >= 0");
    return true;
}

/*---------------------------------------------------------
 * FN: bParseCount
 * DESC: parses the N of "last:N" / "every:K", must be a
 *       positive integer and nothing else
 * PARMS: szText (digits), iOut (value)
 * AUTH: unium (06.03.26)
 *-------------------------------------------------------*/
static auto bParseCount(const std::string &szText, int32_t &iOut) -> bool {
    if (szText.empty())
        return false;
    char *pEnd = nullptr;
    long lVal = std::strtol(szText.c_str(), &pEnd, 10);
    if (*pEnd != '\0' || lVal < 1 || lVal > 1000000)
        return false;
    iOut = (int32_t)lVal;
    return true;
}

auto bResolveAdapterLayers(const SAdapterConfig &sCfg, int32_t iNumLayers, std::vector<int32_t> &viOut,
                           UT::SError &sErr) -> bool {
    viOut.clear();

    if (!sCfg.viLayers.empty()) {
        for (int32_t iL : sCfg.viLayers) {
            if (iL < 0 || iL >= iNumLayers)
                return UT::bFail(sErr, UT::EError::Configuration,
                                 "cross_attend_layers index " + std::to_string(iL) + " outside [0, " +
                                     std::to_string(iNumLayers) + ")");
            viOut.push_back(iL);
        }
    } else {
        const std::string &szSpec = sCfg.szSpec;
        size_t lColon = szSpec.find(':');
        std::string szKind = szSpec.substr(0, lColon);
        int32_t iN = 0;
        if (lColon == std::string::npos || !bParseCount(szSpec.substr(lColon + 1), iN))
            return UT::bFail(sErr, UT::EError::Configuration, "bad cross_attend_spec '" + szSpec + "'");

        if (szKind == "last") {
            for (int32_t i = std::max(0, iNumLayers - iN); i < iNumLayers; i++)
                viOut.push_back(i);
        } else if (szKind == "every") {
            for (int32_t i = 0; i < iNumLayers; i += iN)
                viOut.push_back(i);
        } else {
            return UT::bFail(sErr, UT::EError::Configuration, "bad cross_attend_spec '" + szSpec + "'");
        }
    }

    std::sort(viOut.begin(), viOut.end());
    viOut.erase(std::unique(viOut.begin(), viOut.end()), viOut.end());
    return true;
}

auto bLoadBltConfig(const std::string &szPath, SBltConfig &sConfig, UT::SError &sErr) -> bool {
    std::string szJson = UT::szReadFileToString(szPath);
    if (szJson.empty())
        return UT::bFail(sErr, UT::EError::Configuration, "cannot read " + szPath);

    // <<<s_start(patching)
    SPatcherConfig &sP = sConfig.sPatcher;
    sP.iMaxPatch = UT::iExtractJsonInt(szJson, "patch_size", sP.iMaxPatch);
    sP.iMinPatch = UT::iExtractJsonInt(szJson, "min_patch_size", sP.iMinPatch);
    sP.iWindow = UT::iExtractJsonInt(szJson, "entropy_window", sP.iWindow);
    sP.fThreshold = UT::fExtractJsonFloat(szJson, "patching_threshold", sP.fThreshold);
    sP.fMinThreshold = UT::fExtractJsonFloat(szJson, "min_threshold", sP.fMinThreshold);
    sP.fMaxThreshold = UT::fExtractJsonFloat(szJson, "max_threshold", sP.fMaxThreshold);
    sP.fStepUp = UT::fExtractJsonFloat(szJson, "threshold_step_up", sP.fStepUp);
    sP.fStepDown = UT::fExtractJsonFloat(szJson, "threshold_step_down", sP.fStepDown);

    std::string szMode = UT::szExtractJsonString(szJson, "entropy_mode", szEntropyModeName(sP.eEntropy));
    if (!bParseEntropyMode(szMode, sP.eEntropy))
        return UT::bFail(sErr, UT::EError::Configuration, "unknown entropy_mode '" + szMode + "'");
    szMode = UT::szExtractJsonString(szJson, "threshold_mode", szThresholdModeName(sP.eThreshold));
    if (!bParseThresholdMode(szMode, sP.eThreshold))
        return UT::bFail(sErr, UT::EError::Configuration, "unknown threshold_mode '" + szMode + "'");
    szMode = UT::szExtractJsonString(szJson, "pool_mode", szPoolModeName(sConfig.ePool));
    if (!bParsePoolMode(szMode, sConfig.ePool))
        return UT::bFail(sErr, UT::EError::Configuration, "unknown pool_mode '" + szMode + "'");
    // >>>s_end(patching)

    // <<<s_start(adapter)
    SAdapterConfig &sA = sConfig.sAdapter;
    if (UT::bHasJsonKey(szJson, "cross_attend_layers")) {
        sA.viLayers = UT::viExtractJsonIntArray(szJson, "cross_attend_layers");
        if (sA.viLayers.empty())
            return UT::bFail(sErr, UT::EError::Configuration, "cross_attend_layers is empty");
    }
    sA.szSpec = UT::szExtractJsonString(szJson, "cross_attend_spec", sA.szSpec);
    szMode = UT::szExtractJsonString(szJson, "patch_mask", szPatchMaskName(sA.eMask));
    if (!bParsePatchMask(szMode, sA.eMask))
        return UT::bFail(sErr, UT::EError::Configuration, "unknown patch_mask '" + szMode + "'");
    sA.fGateInit = UT::fExtractJsonFloat(szJson, "gate_init", sA.fGateInit);
    sConfig.bProjectPatches = UT::bExtractJsonBool(szJson, "local_to_global_dim_proj", sConfig.bProjectPatches);
    // >>>s_end(adapter)

    // <<<s_start(local)
    SLocalEncoderConfig &sL = sConfig.sLocal;
    sL.iDim = UT::iExtractJsonInt(szJson, "local_dim", sL.iDim);
    sL.iNLayers = UT::iExtractJsonInt(szJson, "local_layers", sL.iNLayers);
    sL.iNHeads = UT::iExtractJsonInt(szJson, "local_heads", sL.iNHeads);
    sL.iNKvHeads = UT::iExtractJsonInt(szJson, "local_kv_heads", sL.iNKvHeads);
    sL.iHiddenDim = UT::iExtractJsonInt(szJson, "local_hidden_dim", sL.iHiddenDim);
    sL.iWindow = UT::iExtractJsonInt(szJson, "local_window", sL.iWindow);
    sL.iMaxSeqLen = UT::iExtractJsonInt(szJson, "local_max_seq_len", sL.iMaxSeqLen);

    // accepts true/false as well as 0/1
    bool bNgramInt = UT::iExtractJsonInt(szJson, "use_hash_ngrams", sL.bHashNgrams ? 1 : 0) != 0;
    sL.bHashNgrams = UT::bExtractJsonBool(szJson, "use_hash_ngrams", bNgramInt);
    if (UT::bHasJsonKey(szJson, "hash_ngram_sizes"))
        sL.viNgramSizes = UT::viExtractJsonIntArray(szJson, "hash_ngram_sizes");
    sL.iHashBuckets = UT::iExtractJsonInt(szJson, "hash_buckets", sL.iHashBuckets);
    // >>>s_end(local)

    // <<<s_start(checkpoint)
    if (UT::bHasJsonKey(szJson, "checkpoint_files"))
        sConfig.vszCheckpointFiles = UT::vszExtractJsonStringArray(szJson, "checkpoint_files");
    sConfig.bStrictLoad = UT::bExtractJsonBool(szJson, "strict_load", sConfig.bStrictLoad);
    if (UT::bHasJsonKey(szJson, "exclude_params"))
        sConfig.vszExcludeParams = UT::vszExtractJsonStringArray(szJson, "exclude_params");
    sConfig.iMaxSeqLen = UT::iExtractJsonInt(szJson, "max_seq_len", sConfig.iMaxSeqLen);
    // >>>s_end(checkpoint)

    std::cout << "  blt config loaded from " << szPath << std::endl;
    return bValidateBltConfig(sConfig, sErr);
}

auto bValidateBltConfig(const SBltConfig &sCfg, UT::SError &sErr) -> bool {
    if (!MD::bValidateModelConfig(sCfg.sDecoder, sErr))
        return false;

    const SLocalEncoderConfig &sL = sCfg.sLocal;
    if (sL.iNLayers < 0)
        return UT::bFail(sErr, UT::EError::Configuration, "local_layers must be >= 0");
    if (sL.iNHeads > 0 && sL.iDim % sL.iNHeads != 0)
        return UT::bFail(sErr, UT::EError::Configuration, "local_dim must be a multiple of local_heads");
    if (!MD::bValidateBlockConfig(sL.sBlockConfig(), "local encoder", sErr))
        return false;
    if (sL.iWindow < 1)
        return UT::bFail(sErr, UT::EError::Configuration, "local_window must be >= 1");
    if (sL.bHashNgrams) {
        if (sL.iHashBuckets < 1)
            return UT::bFail(sErr, UT::EError::Configuration, "hash_buckets must be >= 1");
        if (sL.viNgramSizes.empty())
            return UT::bFail(sErr, UT::EError::Configuration, "hash_ngram_sizes is empty");
        for (int32_t iN : sL.viNgramSizes) {
            if (iN < 1)
                return UT::bFail(sErr, UT::EError::Configuration,
                                 "hash_ngram_sizes entry " + std::to_string(iN) + " must be >= 1");
        }
    }

    if (!bValidatePatcherConfig(sCfg.sPatcher, sErr))
        return false;

    if (!sCfg.bProjectPatches && sL.iDim != sCfg.sDecoder.iDim)
        return UT::bFail(sErr, UT::EError::Configuration,
                         "local_dim " + std::to_string(sL.iDim) + " != decoder dim " +
                             std::to_string(sCfg.sDecoder.iDim) + " and local_to_global_dim_proj is off");

    std::vector<int32_t> viLayers;
    if (!bResolveAdapterLayers(sCfg.sAdapter, sCfg.sDecoder.iNLayers, viLayers, sErr))
        return false;

    // bos + eos must fit
    if (sCfg.iMaxSeqLen < 2)
        return UT::bFail(sErr, UT::EError::Configuration, "max_seq_len must be >= 2");
    if (sCfg.iMaxSeqLen > sL.iMaxSeqLen)
        return UT::bFail(sErr, UT::EError::Configuration,
                         "max_seq_len " + std::to_string(sCfg.iMaxSeqLen) + " exceeds local_max_seq_len " +
                             std::to_string(sL.iMaxSeqLen));
    if (sCfg.iMaxSeqLen > sCfg.sDecoder.iMaxSeqLen)
        return UT::bFail(sErr, UT::EError::Configuration,
                         "max_seq_len " + std::to_string(sCfg.iMaxSeqLen) + " exceeds max_position_embeddings " +
                             std::to_string(sCfg.sDecoder.iMaxSeqLen));
    return true;
}

void PrintBltConfig(const SBltConfig &sCfg) {
    const SLocalEncoderConfig &sL = sCfg.sLocal;
    const SPatcherConfig &sP = sCfg.sPatcher;
    std::cout << "  local: dim=" << sL.iDim << " layers=" << sL.iNLayers << " heads=" << sL.iNHeads
              << " kv_heads=" << sL.iNKvHeads << " hidden=" << sL.iHiddenDim << " window=" << sL.iWindow
              << " hash_ngrams=" << (sL.bHashNgrams ? "yes" : "no") << std::endl;
    std::cout << "  patcher: entropy=" << szEntropyModeName(sP.eEntropy)
              << " threshold=" << szThresholdModeName(sP.eThreshold) << "(" << sP.fThreshold << ")"
              << " patch=[" << sP.iMinPatch << ", " << sP.iMaxPatch << "] pool=" << szPoolModeName(sCfg.ePool)
              << std::endl;
    std::cout << "  adapter: mask=" << szPatchMaskName(sCfg.sAdapter.eMask) << " gate_init=" << sCfg.sAdapter.fGateInit
              << " proj=" << (sCfg.bProjectPatches ? "yes" : "no") << " max_seq_len=" << sCfg.iMaxSeqLen
              << std::endl;
}
} // namespace BL
