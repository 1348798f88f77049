// Created by Unium on 06.03.26

#pragma once

#include "../Model/mdMdConf.hpp"
#include "../Util/utUtErr_.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace BL {
// <<<s_start(local)
// --- local byte encoder
struct SLocalEncoderConfig {
    int32_t iDim = 2048;
    int32_t iNLayers = 4;
    int32_t iNHeads = 8;
    int32_t iNKvHeads = 8;
    int32_t iHiddenDim = 4096;
    int32_t iWindow = 512; // attention reaches back this many bytes, self included
    int32_t iMaxSeqLen = 4096;
    float fRmsEps = 1e-5f;
    float fRopeTheta = 10000.0f;

    bool bHashNgrams = false;
    std::vector<int32_t> viNgramSizes = {3, 4, 5};
    int32_t iHashBuckets = 50000;

    auto iHeadDim() const -> int32_t { return iNHeads > 0 ? iDim / iNHeads : 0; }
    auto sBlockConfig() const -> MD::SBlockConfig;
};
// >>>s_end(local)

// <<<s_start(patcher)
// --- entropy patcher
enum class EEntropyMode { Histogram, Predictor };
enum class EThresholdMode { Fixed, Adaptive };

struct SPatcherConfig {
    int32_t iMinPatch = 1;
    int32_t iMaxPatch = 4; // "patch_size"
    int32_t iWindow = 8;   // histogram window
    EEntropyMode eEntropy = EEntropyMode::Histogram;
    EThresholdMode eThreshold = EThresholdMode::Fixed;
    float fThreshold = 3.0f; // bits
    float fMinThreshold = 2.0f;
    float fMaxThreshold = 5.0f;
    float fStepUp = 0.1f;
    float fStepDown = 0.1f;
};

/*---------------------------------------------------------
 * FN: bValidatePatcherConfig
 * DESC: rejects patch bounds and thresholds the boundary
 *       rule cannot honour (min > max, min < 1, ...)
 * PARMS: sCfg (patcher config), sErr (status)
 * AUTH: unium (06.03.26)
 *-------------------------------------------------------*/
auto bValidatePatcherConfig(const SPatcherConfig &sCfg, UT::SError &sErr) -> bool;
// >>>s_end(patcher)

enum class EPoolMode { Mean, Last, Max };

// <<<s_start(adapter)
// --- cross attention adapter
enum class EPatchMask {
    Closed, // byte i sees patch j once boundary[j+1] <= i
    None    // every byte sees every patch
};

struct SAdapterConfig {
    std::vector<int32_t> viLayers; // explicit list, wins over szSpec
    std::string szSpec = "last:6"; // "last:N" or "every:K"
    EPatchMask eMask = EPatchMask::Closed;
    float fGateInit = 0.0f;
};

/*---------------------------------------------------------
 * FN: bResolveAdapterLayers
 * DESC: turns the adapter layer selection into a sorted,
 *       de-duplicated list of decoder layer indices. last:N
 *       is clamped to the layer count, explicit indices out
 *       of range are an error
 * PARMS: sCfg (adapter config), iNumLayers (decoder depth),
 *        viOut (resolved indices), sErr (status)
 * AUTH: unium (06.03.26)
 *-------------------------------------------------------*/
auto bResolveAdapterLayers(const SAdapterConfig &sCfg, int32_t iNumLayers, std::vector<int32_t> &viOut,
                           UT::SError &sErr) -> bool;
// >>>s_end(adapter)

/*---------------------------------------------------------
 * FN: SBltConfig
 * DESC: the whole byte latent model: pretrained decoder shape
 *       plus everything grafted onto it
 * AUTH: unium (06.03.26)
 *-------------------------------------------------------*/
struct SBltConfig {
    MD::SModelConfig sDecoder;
    SLocalEncoderConfig sLocal;
    SPatcherConfig sPatcher;
    EPoolMode ePool = EPoolMode::Mean;
    SAdapterConfig sAdapter;
    bool bProjectPatches = true; // local_to_global_dim_proj
    int32_t iMaxSeqLen = 4096;

    // checkpoint boundary
    std::vector<std::string> vszCheckpointFiles;
    bool bStrictLoad = false;
    std::vector<std::string> vszExcludeParams = {"tok_embeddings.weight", "output.weight"};
};

/*---------------------------------------------------------
 * FN: bLoadBltConfig
 * DESC: reads blt_config.json over the defaults already in
 *       sConfig. sConfig.sDecoder is left alone, it comes from
 *       the pretrained config.json
 * PARMS: szPath (path), sConfig (in/out), sErr (status)
 * AUTH: unium (06.03.26)
 *-------------------------------------------------------*/
auto bLoadBltConfig(const std::string &szPath, SBltConfig &sConfig, UT::SError &sErr) -> bool;

auto bValidateBltConfig(const SBltConfig &sCfg, UT::SError &sErr) -> bool;

void PrintBltConfig(const SBltConfig &sCfg);

// <<<s_start(names)
// --- enum <-> string, parsers return false on unknown names
auto bParseEntropyMode(const std::string &szName, EEntropyMode &eOut) -> bool;
auto bParseThresholdMode(const std::string &szName, EThresholdMode &eOut) -> bool;
auto bParsePoolMode(const std::string &szName, EPoolMode &eOut) -> bool;
auto bParsePatchMask(const std::string &szName, EPatchMask &eOut) -> bool;

auto szEntropyModeName(EEntropyMode eMode) -> const char *;
auto szThresholdModeName(EThresholdMode eMode) -> const char *;
auto szPoolModeName(EPoolMode eMode) -> const char *;
auto szPatchMaskName(EPatchMask eMask) -> const char *;
// >>>s_end(names)
} // namespace BL
