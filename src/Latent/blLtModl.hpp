// Created by Unium on 12.03.26

#pragma once

#include "../Model/mdMdBlck.hpp"
#include "../Model/mdMdLoad.hpp"
#include "../Model/mdMdParm.hpp"
#include "../Tensor/mtTnTnsr.hpp"
#include "../Util/utUtErr_.hpp"
#include "blLtConf.hpp"
#include "blLtLenc.hpp"
#include "blLtPool.hpp"
#include "blLtPtch.hpp"
#include "blLtXatn.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace BL {
/*---------------------------------------------------------
 * FN: CByteLatentModel
 * DESC: the pretrained decoder with the byte front end
 *       grafted on. ids -> local encoder -> entropy patches ->
 *       pooled + projected patch vectors -> decoder stack where
 *       the adapted layers cross attend to them -> byte logits.
 *       the blocks point into this object so it never moves
 * AUTH: unium (12.03.26)
 *-------------------------------------------------------*/
class CByteLatentModel {
public:
    CByteLatentModel() = default;
    CByteLatentModel(const CByteLatentModel &) = delete;
    CByteLatentModel &operator=(const CByteLatentModel &) = delete;

    /*---------------------------------------------------------
     * FN: bBuild
     * DESC: validates the config and allocates every weight with
     *       seeded random init, then wires the block stack and
     *       the parameter registry. load a checkpoint after
     * PARMS: sCfg (full config), uSeed (init seed), sErr (status)
     * AUTH: unium (12.03.26)
     *-------------------------------------------------------*/
    auto bBuild(const SBltConfig &sCfg, uint32_t uSeed, UT::SError &sErr) -> bool;

    /*---------------------------------------------------------
     * FN: bForward
     * DESC: logits [L - lPosStart, 259] for positions
     *       [lPosStart, L). patching always runs over all L ids.
     *       without the kv cache lPosStart must be 0, with it
     *       lPosStart must be the cached length
     * PARMS: viIds (byte ids), lPosStart (first row to run),
     *        tLogits (out), sErr (status)
     * AUTH: unium (12.03.26)
     *-------------------------------------------------------*/
    auto bForward(const std::vector<int32_t> &viIds, int64_t lPosStart, MT::CTensor &tLogits, UT::SError &sErr)
        -> bool;

    auto bLoadCheckpoint(const MD::SCheckpointSpec &sSpec, MD::SLoadReport &sReport, UT::SError &sErr) -> bool;
    auto bSaveNewParams(const std::string &szPath, UT::SError &sErr) const -> bool;

    // <<<s_start(cache)
    // --- kv cache on the pretrained blocks
    void EnableKvCache(bool bEnable);
    auto bKvCacheEnabled() const -> bool { return m_bKvCache; }
    void ResetKvCache();
    auto lCachedLen() const -> int64_t;
    // >>>s_end(cache)

    auto sConfig() const -> const SBltConfig & { return m_sCfg; }
    auto sRegistry() -> MD::CParamRegistry & { return m_cReg; }
    auto sRegistry() const -> const MD::CParamRegistry & { return m_cReg; }

    auto iNumLayers() const -> int32_t { return (int32_t)m_vpStack.size(); }
    auto viAdapterLayers() const -> const std::vector<int32_t> & { return m_viAdapterLayers; }
    auto bIsAdapted(int32_t iLayer) const -> bool;

    // what the forward pass runs at layer i, and the pretrained block under it
    auto pBlock(int32_t iLayer) const -> MD::IBlockTransform * { return m_vpStack[iLayer]; }
    auto pDecoderBlock(int32_t iLayer) const -> MD::CDecoderBlock * { return m_vpDecoder[iLayer].get(); }

    auto sPatchContext() const -> const SPatchContext & { return m_sCtx; }
    auto vlLastBoundaries() const -> const std::vector<int64_t> & { return m_sCtx.vlBounds; }

    auto tByteEmbedding() -> MT::CTensor & { return m_tTokEmbed; }
    auto bBuilt() const -> bool { return m_bBuilt; }

private:
    void RegisterParams();

    SBltConfig m_sCfg;
    bool m_bBuilt = false;
    bool m_bKvCache = false;

    // byte front end
    CLocalEncoder m_cLocal;
    MT::CTensor m_tEntropyHead; // [259, local_dim], predictor mode only
    CEntropyPatcher m_cPatcher;
    CPatchAggregator m_cPool;
    MT::CTensor m_tProjW; // patch_projector.proj [dim, local_dim]
    MT::CTensor m_tProjB;

    // decoder
    MT::CTensor m_tTokEmbed; // byte embedding [259, dim]
    std::vector<std::unique_ptr<MD::CDecoderBlock>> m_vpDecoder;
    std::vector<std::unique_ptr<CCrossAttnBlock>> m_vpAdapters;
    std::vector<MD::IBlockTransform *> m_vpStack;
    std::vector<int32_t> m_viAdapterLayers;
    MT::CTensor m_tNorm;   // norm.scale [dim]
    MT::CTensor m_tOutput; // byte head [259, dim]

    SPatchContext m_sCtx;
    MD::CParamRegistry m_cReg;
};
} // namespace BL
