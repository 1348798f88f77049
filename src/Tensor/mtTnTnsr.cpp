// Created by Unium on 20.02.26

#include "mtTnTnsr.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace MT {

// <<<s_start(constructors)
// --- constructors / destructions
CTensor::CTensor() : m_iNdim(0), m_pfData(nullptr), m_iDataSize(0), m_bOwnsData(false) {
    std::memset(m_lShape, 0, sizeof(m_lShape));
    std::memset(m_lStride, 0, sizeof(m_lStride));
}

CTensor::CTensor(std::initializer_list<int64_t> lShape) { Allocate(std::vector<int64_t>(lShape)); }

CTensor::CTensor(const std::vector<int64_t> &vlShape) { Allocate(vlShape); }

CTensor::~CTensor() {
    if (m_bOwnsData && m_pfData) {
        std::free(m_pfData);
        m_pfData = nullptr;
    }
}

/*---------------------------------------------------------
 * FN: CTensor (move)
 * DESC: move constructs from another tensor, the source is
 *       left empty
 * PARMS: other (source tensor)
 * AUTH: unium (12.02.26)
 *-------------------------------------------------------*/
CTensor::CTensor(CTensor &&other) noexcept
    : m_iNdim(other.m_iNdim), m_pfData(other.m_pfData), m_iDataSize(other.m_iDataSize),
      m_bOwnsData(other.m_bOwnsData) {
    std::memcpy(m_lShape, other.m_lShape, sizeof(m_lShape));
    std::memcpy(m_lStride, other.m_lStride, sizeof(m_lStride));
    other.m_pfData = nullptr;
    other.m_bOwnsData = false;
    other.m_iNdim = 0;
}

CTensor &CTensor::operator=(CTensor &&other) noexcept {
    if (this != &other) {
        if (m_bOwnsData && m_pfData) {
            std::free(m_pfData);
        }
        m_iNdim = other.m_iNdim;
        m_pfData = other.m_pfData;
        m_iDataSize = other.m_iDataSize;
        m_bOwnsData = other.m_bOwnsData;
        std::memcpy(m_lShape, other.m_lShape, sizeof(m_lShape));
        std::memcpy(m_lStride, other.m_lStride, sizeof(m_lStride));
        other.m_pfData = nullptr;
        other.m_bOwnsData = false;
        other.m_iNdim = 0;
    }
    return *this;
}

auto CTensor::Clone() const -> CTensor {
    if (bEmpty())
        return CTensor();

    CTensor tOut(vlShape());
    if (bIsContiguous()) {
        std::memcpy(tOut.m_pfData, m_pfData, lNumel() * sizeof(float));
        return tOut;
    }

    // strided view, walk it index by index
    int64_t lN = lNumel();
    int64_t lIdx[mmDims] = {};
    for (int64_t lFlat = 0; lFlat < lN; lFlat++) {
        int64_t lSrcOff = 0;
        for (int d = 0; d < m_iNdim; d++)
            lSrcOff += lIdx[d] * m_lStride[d];
        tOut.m_pfData[lFlat] = m_pfData[lSrcOff];

        for (int d = m_iNdim - 1; d >= 0; d--) {
            if (++lIdx[d] < m_lShape[d])
                break;
            lIdx[d] = 0;
        }
    }
    return tOut;
}
// >>>s_end(constructors)

// <<<s_start(factory)
// --- factory methods
auto CTensor::Zeros(std::initializer_list<int64_t> lShape) -> CTensor {
    return Zeros(std::vector<int64_t>(lShape));
}

auto CTensor::Zeros(const std::vector<int64_t> &vlShape) -> CTensor {
    CTensor t(vlShape);
    std::memset(t.m_pfData, 0, t.lNumel() * sizeof(float));
    return t;
}

auto CTensor::Fill(std::initializer_list<int64_t> lShape, float fVal) -> CTensor {
    return Fill(std::vector<int64_t>(lShape), fVal);
}

/*---------------------------------------------------------
 * FN: Fill (vector)
 * DESC: creates a tensor filled with a given value
 * PARMS: vlShape (dim), fVal (fill value)
 * AUTH: unium (12.02.26)
 *-------------------------------------------------------*/
auto CTensor::Fill(const std::vector<int64_t> &vlShape, float fVal) -> CTensor {
    CTensor t(vlShape);
    int64_t lN = t.lNumel();
    float *pfPtr = t.pfData();
    if (fVal == 0.0f) {
        std::memset(pfPtr, 0, lN * sizeof(float));
        return t;
    }

    // doubling memcpy
    pfPtr[0] = fVal;
    int64_t lFilled = 1;
    while (lFilled < lN) {
        int64_t lChunk = std::min(lFilled, lN - lFilled);
        std::memcpy(pfPtr + lFilled, pfPtr, lChunk * sizeof(float));
        lFilled += lChunk;
    }

    return t;
}

auto CTensor::RandNormal(const std::vector<int64_t> &vlShape, float fStd, std::mt19937 &rng) -> CTensor {
    CTensor t(vlShape);
    std::normal_distribution<float> dist(0.0f, 1.0f);

    int64_t lN = t.lNumel();
    float *pfPtr = t.pfData();
    for (int64_t i = 0; i < lN; i++) {
        float fZ = dist(rng);
        while (fZ < -2.0f || fZ > 2.0f)
            fZ = dist(rng);
        pfPtr[i] = fZ * fStd;
    }
    return t;
}
// >>>s_end(factory)

// <<<s_start(element)
// --- element access
auto CTensor::lNumel() const -> int64_t {
    if (m_iNdim == 0)
        return 0;
    int64_t lN = 1;
    for (int i = 0; i < m_iNdim; i++) {
        lN *= m_lShape[i];
    }
    return lN;
}

auto CTensor::lRows() const -> int64_t { return m_iNdim == 0 ? 0 : m_lShape[0]; }

auto CTensor::lCols() const -> int64_t {
    if (m_iNdim == 0)
        return 0;
    int64_t lN = 1;
    for (int i = 1; i < m_iNdim; i++)
        lN *= m_lShape[i];
    return lN;
}

auto CTensor::fAt(std::initializer_list<int64_t> lIndices) -> float & {
    assert((int)lIndices.size() == m_iNdim && "[ct:fat] wrong number of indices womp womp");
    int64_t lOff = 0;
    int i = 0;
    for (auto lIdx : lIndices) {
        assert(lIdx >= 0 && lIdx < m_lShape[i] && "[ct:fat] index out of bounds");
        lOff += lIdx * m_lStride[i];
        i++;
    }
    return m_pfData[lOff];
}

auto CTensor::fAt(std::initializer_list<int64_t> lIndices) const -> float {
    return const_cast<CTensor *>(this)->fAt(lIndices);
}

auto CTensor::fFlat(int64_t lIdx) -> float & {
    assert(lIdx >= 0 && lIdx < lNumel() && "[ct:fflat] index out of bounds");
    return m_pfData[lIdx];
}

auto CTensor::fFlat(int64_t lIdx) const -> float {
    assert(lIdx >= 0 && lIdx < lNumel() && "[ct:fflat] index out of bounds");
    return m_pfData[lIdx];
}

auto CTensor::pfRow(int64_t lRow) -> float * {
    assert(bIsContiguous() && "[ct:pfrow] row access needs a contiguous tensor");
    assert(lRow >= 0 && lRow < lRows());
    return m_pfData + lRow * lCols();
}

auto CTensor::pfRow(int64_t lRow) const -> const float * {
    assert(bIsContiguous() && "[ct:pfrow] row access needs a contiguous tensor");
    assert(lRow >= 0 && lRow < lRows());
    return m_pfData + lRow * lCols();
}
// >>>s_end(element)

// <<<s_start(shape_manip)
// --- shape manipulation
auto CTensor::bIsContiguous() const -> bool {
    if (m_iNdim == 0)
        return true;
    int64_t lExpected = 1;
    for (int i = m_iNdim - 1; i >= 0; i--) {
        if (m_lStride[i] != lExpected)
            return false;
        lExpected *= m_lShape[i];
    }
    return true;
}

auto CTensor::vlShape() const -> std::vector<int64_t> { return std::vector<int64_t>(m_lShape, m_lShape + m_iNdim); }

auto CTensor::bSameShape(const std::vector<int64_t> &vlOther) const -> bool {
    if ((int)vlOther.size() != m_iNdim)
        return false;
    for (int i = 0; i < m_iNdim; i++) {
        if (vlOther[i] != m_lShape[i])
            return false;
    }
    return true;
}
// >>>s_end(shape_manip)

// <<<s_start(utils)
// --- printing utils
auto szShapeOf(const std::vector<int64_t> &vlShape) -> std::string {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < vlShape.size(); i++) {
        if (i > 0)
            oss << ", ";
        oss << vlShape[i];
    }
    oss << "]";
    return oss.str();
}

auto CTensor::szShape() const -> std::string { return szShapeOf(vlShape()); }
// >>>s_end(utils)

// <<<s_start(internal)
// --- internal helpers
void CTensor::Allocate(const std::vector<int64_t> &vlShape) {
    assert(vlShape.size() > 0 && vlShape.size() <= mmDims);

    m_iNdim = (int)vlShape.size();
    m_bOwnsData = true;

    std::memset(m_lShape, 0, sizeof(m_lShape));
    std::memset(m_lStride, 0, sizeof(m_lStride));

    for (int i = 0; i < m_iNdim; i++) {
        assert(vlShape[i] > 0 && "[ct:allocate] shape dimensions must be positive");
        m_lShape[i] = vlShape[i];
    }

    ComputeStrides();

    m_iDataSize = lNumel() * sizeof(float);
    m_pfData = static_cast<float *>(std::aligned_alloc(64, (m_iDataSize + 63) & ~size_t(63)));
    assert(m_pfData && "[ct:allocate] tensor allocation failed");
}

void CTensor::ComputeStrides() {
    if (m_iNdim == 0)
        return;
    m_lStride[m_iNdim - 1] = 1;
    for (int i = m_iNdim - 2; i >= 0; i--) {
        m_lStride[i] = m_lStride[i + 1] * m_lShape[i + 1];
    }
}
// >>>s_end(internal)
} // namespace MT
