// Created by Unium on 07.03.26

#include "blLtLenc.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include "../Tokenizer/tkTkByte.hpp"

using namespace MT;

namespace BL {

void CLocalEncoder::Init(const SLocalEncoderConfig &sCfg, float fStd, std::mt19937 &rng) {
    m_sCfg = sCfg;
    const int64_t lDim = sCfg.iDim;

    m_tEmbed = CTensor::RandNormal({TK::kByteVocab, lDim}, fStd, rng);

    m_vtHash.clear();
    if (sCfg.bHashNgrams) {
        for (size_t k = 0; k < sCfg.viNgramSizes.size(); k++)
            m_vtHash.push_back(CTensor::RandNormal({(int64_t)sCfg.iHashBuckets, lDim}, fStd, rng));
    }

    const MD::SBlockConfig sBlk = sCfg.sBlockConfig();
    m_vpLayers.clear();
    for (int32_t i = 0; i < sCfg.iNLayers; i++)
        m_vpLayers.push_back(std::make_unique<MD::CDecoderBlock>(sBlk, MD::InitBlockWeights(sBlk, fStd, rng)));

    m_tNorm = CTensor::Fill({lDim}, 1.0f);
}

auto CLocalEncoder::uHashNgram(const int32_t *piLast, int32_t iN) -> uint64_t {
    uint64_t uHash = 14695981039346656037ull;
    for (int32_t k = iN - 1; k >= 0; k--) {
        uHash ^= (uint64_t)(uint32_t)piLast[-k];
        uHash *= 1099511628211ull;
    }
    return uHash;
}

auto CLocalEncoder::tEmbed(const std::vector<int32_t> &viIds) const -> CTensor {
    CTensor tH = OP::GatherRows(m_tEmbed, viIds);
    if (m_vtHash.empty())
        return tH;

    const int64_t lLen = (int64_t)viIds.size();
    const int64_t lDim = m_sCfg.iDim;
    for (size_t k = 0; k < m_vtHash.size(); k++) {
        const int32_t iN = m_sCfg.viNgramSizes[k];
        for (int64_t i = iN - 1; i < lLen; i++) {
            uint64_t uBucket = uHashNgram(&viIds[i], iN) % (uint64_t)m_sCfg.iHashBuckets;
            const float *pfSrc = m_vtHash[k].pfRow((int64_t)uBucket);
            float *pfDst = tH.pfRow(i);
            for (int64_t d = 0; d < lDim; d++)
                pfDst[d] += pfSrc[d];
        }
    }
    return tH;
}

auto CLocalEncoder::bEncode(const std::vector<int32_t> &viIds, CTensor &tOut, UT::SError &sErr) -> bool {
    if (m_tEmbed.bEmpty())
        return UT::bFail(sErr, UT::EError::Internal, "local encoder used before Init");

    if ((int64_t)viIds.size() > m_sCfg.iMaxSeqLen)
        return UT::bFail(sErr, UT::EError::Configuration,
                         "sequence of " + std::to_string(viIds.size()) + " bytes exceeds local_max_seq_len " +
                             std::to_string(m_sCfg.iMaxSeqLen));
    for (size_t i = 0; i < viIds.size(); i++) {
        if (viIds[i] < 0 || viIds[i] >= TK::kByteVocab)
            return UT::bFail(sErr, UT::EError::Encoding,
                             "id " + std::to_string(viIds[i]) + " at position " + std::to_string(i) +
                                 " outside the byte vocabulary");
    }

    if (viIds.empty()) {
        tOut = CTensor();
        return true;
    }

    CTensor tH = tEmbed(viIds);
    for (auto &pLayer : m_vpLayers)
        tH = pLayer->Apply(tH, 0);

    tOut = OP::RmsNorm(tH, m_tNorm, m_sCfg.fRmsEps);
    return true;
}

void CLocalEncoder::RegisterParams(MD::CParamRegistry &sReg, const std::string &szPrefix) {
    sReg.Add(szPrefix + "tok_embeddings.weight", m_tEmbed, MD::EOrigin::New);
    for (size_t k = 0; k < m_vtHash.size(); k++)
        sReg.Add(szPrefix + "hash_embeddings." + std::to_string(k) + ".weight", m_vtHash[k], MD::EOrigin::New);
    for (size_t i = 0; i < m_vpLayers.size(); i++)
        MD::AddBlockParams(sReg, szPrefix + "layers." + std::to_string(i) + ".", m_vpLayers[i]->sWeights(),
                           MD::EOrigin::New);
    sReg.Add(szPrefix + "norm.scale", m_tNorm, MD::EOrigin::New);
}
} // namespace BL
