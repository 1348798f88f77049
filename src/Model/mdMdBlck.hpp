// Created by Unium on 25.02.26

#pragma once

#include "../Tensor/mtTnTnsr.hpp"
#include "mdMdConf.hpp"
#include <cstdint>
#include <random>

namespace MD {
/*---------------------------------------------------------
 * FN: IBlockTransform
 * DESC: one step of the decoder stack, hidden [n, dim] in and
 *       out. row r of the input sits at absolute position
 *       lPosStart + r
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
class IBlockTransform {
public:
    virtual ~IBlockTransform() = default;

    virtual auto Apply(const MT::CTensor &tHidden, int64_t lPosStart) -> MT::CTensor = 0;

    // drops any per-sequence state (kv cache), no-op if none
    virtual void ResetCache() = 0;
};

// torchtune layout, names follow the checkpoint keys
struct SBlockWeights {
    MT::CTensor tSaNorm; // sa_norm.scale [dim]
    MT::CTensor tWq;     // attn.q_proj [heads*hd, dim]
    MT::CTensor tBq;
    MT::CTensor tWk; // attn.k_proj [kv*hd, dim]
    MT::CTensor tBk;
    MT::CTensor tWv; // attn.v_proj [kv*hd, dim]
    MT::CTensor tBv;
    MT::CTensor tWo;      // attn.output_proj [dim, heads*hd], no bias
    MT::CTensor tMlpNorm; // mlp_norm.scale [dim]
    MT::CTensor tW1;      // mlp.w1 gate [hidden, dim]
    MT::CTensor tW2;      // mlp.w2 down [dim, hidden]
    MT::CTensor tW3;      // mlp.w3 up [hidden, dim]
};

/*---------------------------------------------------------
 * FN: InitBlockWeights
 * DESC: allocates block weights with N(0, fStd) projections,
 *       zero biases and unit norm scales
 * PARMS: sCfg (block shape), fStd (init std), rng (generator)
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
auto InitBlockWeights(const SBlockConfig &sCfg, float fStd, std::mt19937 &rng) -> SBlockWeights;

struct SKvCache {
    MT::CTensor tK; // [max_seq, kv_dim]
    MT::CTensor tV; // [max_seq, kv_dim]
    int64_t lLen = 0;
};

/*---------------------------------------------------------
 * FN: CDecoderBlock
 * DESC: pre-norm gqa self attention (rope, optional window)
 *       + swiglu mlp. the pretrained qwen2 block, and with a
 *       window the local encoder layer
 * AUTH: unium (25.02.26 R: 03.03.26)
 *-------------------------------------------------------*/
class CDecoderBlock : public IBlockTransform {
public:
    CDecoderBlock(const SBlockConfig &sCfg, SBlockWeights sWeights);

    /*---------------------------------------------------------
     * FN: Apply
     * DESC: runs the block. without a cache lPosStart must be 0
     *       and the rows are the whole sequence. with a cache
     *       lPosStart must equal the cached length and the new
     *       keys/values are appended
     * PARMS: tHidden ([n, dim]), lPosStart
     * AUTH: unium (25.02.26 R: 03.03.26)
     *-------------------------------------------------------*/
    auto Apply(const MT::CTensor &tHidden, int64_t lPosStart) -> MT::CTensor override;

    void ResetCache() override;

    void EnableCache(int64_t lMaxLen);
    void DisableCache();
    auto bCacheEnabled() const -> bool { return !m_sKv.tK.bEmpty(); }
    auto lCacheLen() const -> int64_t { return m_sKv.lLen; }

    auto sConfig() const -> const SBlockConfig & { return m_sCfg; }
    auto sWeights() -> SBlockWeights & { return m_sW; }
    auto sWeights() const -> const SBlockWeights & { return m_sW; }

private:
    SBlockConfig m_sCfg;
    SBlockWeights m_sW;
    SKvCache m_sKv;
};
} // namespace MD
