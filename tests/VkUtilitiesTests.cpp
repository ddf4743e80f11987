#include <VkUtilities.hpp>
#include <gtest/gtest.h>

namespace
{
    constexpr VkColorComponentFlags kRgba = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                                            VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
}

TEST(VkUtilities, OpaqueAttachmentWritesWithoutBlending)
{
    const VkPipelineColorBlendAttachmentState att = vkutil::makeColorBlendAttachment(false);

    EXPECT_EQ(att.blendEnable, VK_FALSE);
    EXPECT_EQ(att.colorWriteMask, kRgba);
}

TEST(VkUtilities, BlendedAttachmentUsesSourceAlpha)
{
    const VkPipelineColorBlendAttachmentState att = vkutil::makeColorBlendAttachment(true);

    EXPECT_EQ(att.blendEnable, VK_TRUE);
    EXPECT_EQ(att.srcColorBlendFactor, VK_BLEND_FACTOR_SRC_ALPHA);
    EXPECT_EQ(att.dstColorBlendFactor, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA);
    EXPECT_EQ(att.colorWriteMask, kRgba);
}

TEST(VkUtilities, DepthStencilStateTestsDepth)
{
    const VkPipelineDepthStencilStateCreateInfo ds = vkutil::makeDepthStencilState(false);

    EXPECT_EQ(ds.depthTestEnable, VK_TRUE);
    EXPECT_EQ(ds.depthWriteEnable, VK_FALSE);
    EXPECT_EQ(ds.stencilTestEnable, VK_FALSE);
}
