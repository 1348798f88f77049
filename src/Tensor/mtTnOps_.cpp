// Created by Unium on 12.02.26

#include "mtTnOps_.hpp"
#include "../Thread/mtThPool.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstring>

namespace MT {
namespace OP {
// <<<s_start(linear)
// --- projections
auto fDot(const float *pfA, const float *pfB, int64_t lN) -> float {
    float fS0 = 0.0f, fS1 = 0.0f, fS2 = 0.0f, fS3 = 0.0f;
    int64_t i = 0;
    const int64_t lN4 = lN - (lN % 4);
    for (; i < lN4; i += 4) {
        fS0 += pfA[i] * pfB[i];
        fS1 += pfA[i + 1] * pfB[i + 1];
        fS2 += pfA[i + 2] * pfB[i + 2];
        fS3 += pfA[i + 3] * pfB[i + 3];
    }
    float fSum = fS0 + fS1 + fS2 + fS3;
    for (; i < lN; i++)
        fSum += pfA[i] * pfB[i];
    return fSum;
}

auto Linear(const CTensor &tX, const CTensor &tW) -> CTensor { return Linear(tX, tW, CTensor()); }

auto Linear(const CTensor &tX, const CTensor &tW, const CTensor &tB) -> CTensor {
    assert(tX.bIsContiguous() && tW.bIsContiguous());
    assert(tW.m_iNdim == 2 && "[op:linear] weight must be [out, in]");

    const int64_t lIn = tW.m_lShape[1];
    const int64_t lOut = tW.m_lShape[0];
    assert(tX.m_lShape[tX.m_iNdim - 1] == lIn && "[op:linear] inner dim mismatch");
    const int64_t lN = tX.lNumel() / lIn;
    const bool bBias = !tB.bEmpty();
    assert(!bBias || tB.lNumel() == lOut);

    CTensor tOut({lN, lOut});
    const float *pfX = tX.pfData();
    const float *pfW = tW.pfData();
    const float *pfB = bBias ? tB.pfData() : nullptr;
    float *pfO = tOut.pfData();

    // one task = one output element, rows of W stay hot across n
    TH::ParFor(lN * lOut, [=](int64_t lStart, int64_t lEnd) {
        for (int64_t lFlat = lStart; lFlat < lEnd; lFlat++) {
            int64_t r = lFlat / lOut;
            int64_t o = lFlat % lOut;
            float fV = fDot(pfX + r * lIn, pfW + o * lIn, lIn);
            pfO[lFlat] = pfB ? fV + pfB[o] : fV;
        }
    });

    return tOut;
}
// >>>s_end(linear)

// <<<s_start(activation)
// --- activations / normalization
auto RmsNorm(const CTensor &tX, const CTensor &tW, float fEps) -> CTensor {
    assert(tX.bIsContiguous() && tW.bIsContiguous());
    assert(tW.m_iNdim == 1);

    const int64_t lNormDim = tX.m_lShape[tX.m_iNdim - 1];
    assert(tW.m_lShape[0] == lNormDim);

    CTensor tOut(tX.vlShape());
    const float *__restrict__ pfX = tX.pfData();
    const float *__restrict__ pfW = tW.pfData();
    float *__restrict__ pfO = tOut.pfData();

    const int64_t lRows = tX.lNumel() / lNormDim;
    const float fInvDim = 1.0f / (float)lNormDim;

    for (int64_t r = 0; r < lRows; r++) {
        const float *__restrict__ pfRow = pfX + r * lNormDim;
        float *__restrict__ pfOutRow = pfO + r * lNormDim;

        const float fSS = fDot(pfRow, pfRow, lNormDim);
        const float fRms = 1.0f / std::sqrt(fSS * fInvDim + fEps);

        for (int64_t i = 0; i < lNormDim; i++) {
            pfOutRow[i] = pfRow[i] * fRms * pfW[i];
        }
    }

    return tOut;
}

void SoftmaxRowsInplace(CTensor &tA) {
    assert(tA.bIsContiguous());
    const int64_t lDim = tA.m_lShape[tA.m_iNdim - 1];
    const int64_t lRows = tA.lNumel() / lDim;
    float *pfA = tA.pfData();

    for (int64_t r = 0; r < lRows; r++) {
        float *pfRow = pfA + r * lDim;
        float fMax = *std::max_element(pfRow, pfRow + lDim);

        float fSumExp = 0.0f;
        for (int64_t d = 0; d < lDim; d++) {
            pfRow[d] = std::exp(pfRow[d] - fMax);
            fSumExp += pfRow[d];
        }

        const float fInvSum = 1.0f / fSumExp;
        for (int64_t d = 0; d < lDim; d++)
            pfRow[d] *= fInvSum;
    }
}

void SiluMulInplace(CTensor &tGate, const CTensor &tUp) {
    assert(tGate.lNumel() == tUp.lNumel() && "[op:silumul] shape mismatch");
    float *pfG = tGate.pfData();
    const float *pfU = tUp.pfData();
    const int64_t lN = tGate.lNumel();
    for (int64_t i = 0; i < lN; i++) {
        float fX = pfG[i];
        pfG[i] = fX / (1.0f + std::exp(-fX)) * pfU[i];
    }
}
// >>>s_end(activation)

// <<<s_start(index)
// --- indexing
auto GatherRows(const CTensor &tTable, const std::vector<int32_t> &viIdx) -> CTensor {
    assert(tTable.bIsContiguous() && tTable.m_iNdim == 2);
    assert(!viIdx.empty() && "[op:gather] nothing to gather");

    const int64_t lRowSize = tTable.m_lShape[1];
    CTensor tOut({(int64_t)viIdx.size(), lRowSize});

    for (size_t i = 0; i < viIdx.size(); i++) {
        int32_t iRow = viIdx[i];
        assert(iRow >= 0 && iRow < tTable.m_lShape[0] && "[op:gather] gather index out of bounds");
        std::memcpy(tOut.pfData() + i * lRowSize, tTable.pfData() + iRow * lRowSize, lRowSize * sizeof(float));
    }

    return tOut;
}

auto SliceRange(const CTensor &tA, int64_t lStart, int64_t lEnd) -> CTensor {
    assert(tA.m_iNdim >= 1);
    assert(lStart >= 0 && lStart < lEnd && lEnd <= tA.m_lShape[0]);

    CTensor tOut;
    tOut.m_iNdim = tA.m_iNdim;
    tOut.m_lShape[0] = lEnd - lStart;
    for (int i = 1; i < tA.m_iNdim; i++) {
        tOut.m_lShape[i] = tA.m_lShape[i];
    }
    for (int i = 0; i < tA.m_iNdim; i++) {
        tOut.m_lStride[i] = tA.m_lStride[i];
    }

    tOut.m_pfData = tA.m_pfData + lStart * tA.m_lStride[0];
    tOut.m_iDataSize = tOut.lNumel() * sizeof(float);
    tOut.m_bOwnsData = false;

    return tOut;
}
// >>>s_end(index)

// <<<s_start(ipo)
// --- in place opers
void CopyInto(CTensor &tDst, const CTensor &tSrc, int64_t lRowOffset) {
    assert(tDst.bIsContiguous() && tSrc.bIsContiguous());
    assert(tDst.lCols() == tSrc.lCols() && "[op:copyinto] shape mismatch");
    assert(lRowOffset >= 0);
    assert(lRowOffset + tSrc.lRows() <= tDst.lRows() && "[op:copyinto] out of bounds");

    const int64_t lRowSize = tSrc.lCols();
    std::memcpy(tDst.pfData() + lRowOffset * lRowSize, tSrc.pfData(), tSrc.lNumel() * sizeof(float));
}

void FillInplace(CTensor &tA, float fVal) {
    assert(tA.bIsContiguous());
    float *pfA = tA.pfData();
    int64_t lN = tA.lNumel();

    if (fVal == 0.0f) {
        std::memset(pfA, 0, lN * sizeof(float));
    } else {
        std::fill(pfA, pfA + lN, fVal);
    }
}

void AddScaledInplace(CTensor &tDst, const CTensor &tSrc, float fScale) {
    assert(tDst.bIsContiguous() && tSrc.bIsContiguous());
    assert(tDst.lNumel() == tSrc.lNumel() && "[op:addscaled] shape mismatch");
    float *pfD = tDst.pfData();
    const float *pfS = tSrc.pfData();
    const int64_t lN = tDst.lNumel();

    if (fScale == 1.0f) {
        for (int64_t i = 0; i < lN; i++)
            pfD[i] += pfS[i];
        return;
    }
    for (int64_t i = 0; i < lN; i++)
        pfD[i] += fScale * pfS[i];
}
// >>>s_end(ipo)

// <<<s_start(check)
// --- checks
auto bAllFinite(const CTensor &tA) -> bool {
    const float *pfA = tA.pfData();
    const int64_t lN = tA.lNumel();
    for (int64_t i = 0; i < lN; i++) {
        if (!std::isfinite(pfA[i]))
            return false;
    }
    return true;
}
// >>>s_end(check)
} // namespace OP
} // namespace MT
