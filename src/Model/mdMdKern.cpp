// Created by Unium on 03.03.26

#include "mdMdKern.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include "../Thread/mtThPool.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstring>

using namespace MT;

namespace MD {

// <<<s_start(rope)
// --- RoPE
void ApplyRopeRows(CTensor &tX, int32_t iNHeads, int32_t iHeadDim, int64_t lPosStart, float fTheta) {
    assert(tX.bIsContiguous());
    assert(tX.lCols() == (int64_t)iNHeads * iHeadDim && "[md:rope] row width != heads * head_dim");

    const int32_t iHalf = iHeadDim / 2;
    std::vector<float> vfFreq(iHalf);
    for (int32_t i = 0; i < iHalf; i++)
        vfFreq[i] = 1.0f / std::pow(fTheta, (float)(2 * i) / (float)iHeadDim);

    const int64_t lRows = tX.lRows();
    for (int64_t r = 0; r < lRows; r++) {
        float *pfRow = tX.pfRow(r);
        const float fPos = (float)(lPosStart + r);

        for (int32_t i = 0; i < iHalf; i++) {
            float fAngle = fPos * vfFreq[i];
            float fCos = std::cos(fAngle);
            float fSin = std::sin(fAngle);

            for (int32_t iH = 0; iH < iNHeads; iH++) {
                float *pfH = pfRow + iH * iHeadDim;
                float fReal = pfH[i];
                float fImag = pfH[i + iHalf];

                // --- llama rot
                // out[i]      = x[i]*cos - x[i+half]*sin
                // out[i+half] = x[i]*sin + x[i+half]*cos
                pfH[i] = fReal * fCos - fImag * fSin;
                pfH[i + iHalf] = fReal * fSin + fImag * fCos;
            }
        }
    }
}
// >>>s_end(rope)

// <<<s_start(attention)
// --- attention
void CausalSpans(int64_t lPosStart, int64_t lRows, int32_t iWindow, std::vector<int64_t> &vlBegin,
                 std::vector<int64_t> &vlEnd) {
    vlBegin.resize(lRows);
    vlEnd.resize(lRows);
    for (int64_t r = 0; r < lRows; r++) {
        int64_t lPos = lPosStart + r;
        vlEnd[r] = lPos + 1;
        vlBegin[r] = (iWindow > 0) ? std::max<int64_t>(0, lPos - iWindow + 1) : 0;
    }
}

auto SpanAttention(const CTensor &tQ, const CTensor &tK, const CTensor &tV, const SAttnShape &sShape,
                   const std::vector<int64_t> &vlBegin, const std::vector<int64_t> &vlEnd) -> CTensor {
    const int32_t iNHeads = sShape.iNHeads;
    const int32_t iHeadDim = sShape.iHeadDim;
    const int32_t iGrpSize = iNHeads / sShape.iNKvHeads;
    const int64_t lQDim = (int64_t)iNHeads * iHeadDim;
    const int64_t lKvDim = (int64_t)sShape.iNKvHeads * iHeadDim;
    const int64_t lRows = tQ.lRows();

    assert(tQ.bIsContiguous() && tQ.lCols() == lQDim && "[md:attn] query width mismatch");
    assert((int64_t)vlBegin.size() == lRows && (int64_t)vlEnd.size() == lRows);

    auto tOut = CTensor::Zeros({lRows, lQDim});
    if (tK.bEmpty())
        return tOut;

    assert(tK.bIsContiguous() && tV.bIsContiguous());
    assert(tK.lCols() == lKvDim && tV.lCols() == lKvDim && "[md:attn] key/value width mismatch");

    const float fScale = 1.0f / std::sqrt((float)iHeadDim);
    const float *pfK = tK.pfData();
    const float *pfV = tV.pfData();
    const int64_t lKeys = tK.lRows();

    // one task = one (row, head) pair
    TH::ParFor(lRows * iNHeads, [&](int64_t lStart, int64_t lEnd) {
        std::vector<float> vfScores;
        for (int64_t lTask = lStart; lTask < lEnd; lTask++) {
            const int64_t r = lTask / iNHeads;
            const int32_t iH = (int32_t)(lTask % iNHeads);
            const int64_t lBegin = vlBegin[r];
            const int64_t lStop = std::min(vlEnd[r], lKeys);
            if (lBegin >= lStop)
                continue;

            const int32_t iKvHead = iH / iGrpSize;
            const float *pfQh = tQ.pfRow(r) + iH * iHeadDim;
            float *pfOutH = tOut.pfRow(r) + iH * iHeadDim;

            vfScores.resize(lStop - lBegin);
            for (int64_t iT = lBegin; iT < lStop; iT++) {
                const float *pfKt = pfK + iT * lKvDim + iKvHead * iHeadDim;
                vfScores[iT - lBegin] = OP::fDot(pfQh, pfKt, iHeadDim) * fScale;
            }

            float fMax = *std::max_element(vfScores.begin(), vfScores.end());
            float fSum = 0.0f;
            for (auto &fS : vfScores) {
                fS = std::exp(fS - fMax);
                fSum += fS;
            }
            const float fInvSum = 1.0f / fSum;

            for (int64_t iT = lBegin; iT < lStop; iT++) {
                const float fW = vfScores[iT - lBegin] * fInvSum;
                const float *pfVt = pfV + iT * lKvDim + iKvHead * iHeadDim;
                for (int32_t i = 0; i < iHeadDim; i++)
                    pfOutH[i] += fW * pfVt[i];
            }
        }
    });

    return tOut;
}
// >>>s_end(attention)

// <<<s_start(ffn)
// --- feed-forward
auto SwiGlu(const CTensor &tX, const CTensor &tW1, const CTensor &tW3, const CTensor &tW2) -> CTensor {
    auto tGate = OP::Linear(tX, tW1);
    auto tUp = OP::Linear(tX, tW3);
    OP::SiluMulInplace(tGate, tUp);
    return OP::Linear(tGate, tW2);
}
// >>>s_end(ffn)
} // namespace MD
