//============================================================
// Solid.cpp
//============================================================
#include "Solid.hpp"

#include <utility>

Solid::Solid(std::string featureId, FeatureAttributesPtr attributes) :
    m_featureId{std::move(featureId)},
    m_attributes{std::move(attributes)}
{
}

Solid::~Solid() noexcept = default;

void Solid::setShapeInfo(double depth, int holeCount, double footprintArea, bool windingConsistent) noexcept
{
    m_depth             = depth;
    m_holeCount         = holeCount;
    m_footprintArea     = footprintArea;
    m_windingConsistent = windingConsistent;
}

void Solid::setGpu(std::unique_ptr<GpuResources> gpu) noexcept
{
    m_gpu = std::move(gpu);
}
