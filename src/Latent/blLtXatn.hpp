// Created by Unium on 10.03.26

#pragma once

#include "../Model/mdMdBlck.hpp"
#include "../Model/mdMdParm.hpp"
#include "../Tensor/mtTnTnsr.hpp"
#include "blLtConf.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace BL {
// what every adapted block attends to during one forward pass,
// owned by the model and refreshed before the decoder runs
struct SPatchContext {
    MT::CTensor tPatches; // [P, model_dim], projected
    std::vector<int64_t> vlBounds;
    EPatchMask eMask = EPatchMask::Closed;
};

/*---------------------------------------------------------
 * FN: PatchSpans
 * DESC: per row key range into the patch list. closed: row at
 *       position i sees patches [0, n) where n counts patches
 *       with boundary[j + 1] <= i. none: every row sees all
 * PARMS: lPosStart, lRows (rows of the query block), vlBounds,
 *        eMask, vlBegin/vlEnd (out)
 * AUTH: unium (10.03.26)
 *-------------------------------------------------------*/
void PatchSpans(int64_t lPosStart, int64_t lRows, const std::vector<int64_t> &vlBounds, EPatchMask eMask,
                std::vector<int64_t> &vlBegin, std::vector<int64_t> &vlEnd);

// torchtune TransformerCrossAttentionLayer layout
struct SCrossAttnWeights {
    MT::CTensor tCaNorm; // ca_norm.scale [dim]
    MT::CTensor tWq;     // attn.q_proj [heads*hd, dim]
    MT::CTensor tBq;
    MT::CTensor tWk; // attn.k_proj [kv*hd, dim]
    MT::CTensor tBk;
    MT::CTensor tWv; // attn.v_proj [kv*hd, dim]
    MT::CTensor tBv;
    MT::CTensor tWo;      // attn.output_proj [dim, heads*hd]
    MT::CTensor tCaGate;  // ca_scale.scale [1], applied through tanh
    MT::CTensor tMlpNorm; // mlp_norm.scale [dim]
    MT::CTensor tW1;
    MT::CTensor tW2;
    MT::CTensor tW3;
    MT::CTensor tMlpGate; // mlp_scale.scale [1]
};

auto InitCrossAttnWeights(const MD::SBlockConfig &sCfg, float fStd, float fGateInit, std::mt19937 &rng)
    -> SCrossAttnWeights;

/*---------------------------------------------------------
 * FN: CCrossAttnBlock
 * DESC: decorates a decoder block with a gated cross attention
 *       sub layer over the patch vectors. the wrapped block is
 *       borrowed, not owned, and runs untouched first:
 *         h = inner(h)
 *         h += tanh(ca_gate) * o_proj(xattn(ca_norm(h), patches))
 *         h += tanh(mlp_gate) * mlp(mlp_norm(h))
 *       rows that see no patch get neither update
 * AUTH: unium (10.03.26)
 *-------------------------------------------------------*/
class CCrossAttnBlock : public MD::IBlockTransform {
public:
    CCrossAttnBlock(MD::IBlockTransform *pInner, const MD::SBlockConfig &sCfg, SCrossAttnWeights sWeights,
                    const SPatchContext *psContext);

    auto Apply(const MT::CTensor &tHidden, int64_t lPosStart) -> MT::CTensor override;

    void ResetCache() override { m_pInner->ResetCache(); }

    // szPrefix is "layers.{i}.fusion_layer."
    void RegisterParams(MD::CParamRegistry &sReg, const std::string &szPrefix);

    auto pInner() const -> MD::IBlockTransform * { return m_pInner; }
    auto sWeights() -> SCrossAttnWeights & { return m_sW; }

private:
    MD::IBlockTransform *m_pInner;
    MD::SBlockConfig m_sCfg;
    SCrossAttnWeights m_sW;
    const SPatchContext *m_psContext;
};
} // namespace BL
