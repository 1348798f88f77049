// Created by Unium on 07.03.26

#pragma once

#include "../Model/mdMdBlck.hpp"
#include "../Model/mdMdParm.hpp"
#include "../Tensor/mtTnTnsr.hpp"
#include "../Util/utUtErr_.hpp"
#include "blLtConf.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace BL {
/*---------------------------------------------------------
 * FN: CLocalEncoder
 * DESC: small byte transformer in front of the decoder. byte
 *       embedding (+ hashed n-gram embeddings), windowed causal
 *       blocks, final rmsnorm, no output head. output row i only
 *       depends on ids [i - window + 1, i] per layer
 * AUTH: unium (07.03.26)
 *-------------------------------------------------------*/
class CLocalEncoder {
public:
    CLocalEncoder() = default;

    /*---------------------------------------------------------
     * FN: Init
     * DESC: allocates every weight, N(0, fStd) for matrices,
     *       ones for norm scales, zeros for biases
     * PARMS: sCfg (encoder shape), fStd (init std), rng
     * AUTH: unium (07.03.26)
     *-------------------------------------------------------*/
    void Init(const SLocalEncoderConfig &sCfg, float fStd, std::mt19937 &rng);

    /*---------------------------------------------------------
     * FN: bEncode
     * DESC: ids [L] -> representations [L, dim]. L = 0 gives an
     *       empty tensor
     * PARMS: viIds (byte ids incl specials), tOut (reps out),
     *        sErr (status)
     * AUTH: unium (07.03.26)
     *-------------------------------------------------------*/
    auto bEncode(const std::vector<int32_t> &viIds, MT::CTensor &tOut, UT::SError &sErr) -> bool;

    // "local_encoder." + tok_embeddings / hash_embeddings.k / layers.i / norm
    void RegisterParams(MD::CParamRegistry &sReg, const std::string &szPrefix);

    /*---------------------------------------------------------
     * FN: uHashNgram
     * DESC: fnv-1a over the n ids ending at piLast (inclusive),
     *       the bucket is this mod hash_buckets
     * PARMS: piLast (pointer to last id of the n-gram), iN
     * AUTH: unium (07.03.26)
     *-------------------------------------------------------*/
    static auto uHashNgram(const int32_t *piLast, int32_t iN) -> uint64_t;

    auto sConfig() const -> const SLocalEncoderConfig & { return m_sCfg; }
    auto iDim() const -> int32_t { return m_sCfg.iDim; }

private:
    auto tEmbed(const std::vector<int32_t> &viIds) const -> MT::CTensor;

    SLocalEncoderConfig m_sCfg;
    MT::CTensor m_tEmbed;              // [259, dim]
    std::vector<MT::CTensor> m_vtHash; // one [buckets, dim] per n-gram size
    std::vector<std::unique_ptr<MD::CDecoderBlock>> m_vpLayers;
    MT::CTensor m_tNorm; // [dim]
};
} // namespace BL
