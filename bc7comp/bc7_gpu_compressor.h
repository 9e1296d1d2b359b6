#pragma once

#include "bc7comp.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>
#include <vulkan/vulkan.h>

namespace bc7comp {

enum compression_variant {
    BC7_VARIANT_BC7 = 0
};

// Per-task uniforms, binding 2.
struct bc7_gpu_uniforms
{
    uint32_t width;
    uint32_t height;
    uint32_t texture_y_offset; // first texel row read from the source image
    uint32_t blocks_offset;    // in 32-bit words
};

// std430 mirror of bc7_enc_settings, binding 3.
struct bc7_gpu_settings
{
    uint32_t refine_iterations[8];
    uint32_t mode_selection[8];
    uint32_t skip_mode2;
    uint32_t fast_skip_threshold_mode1;
    uint32_t fast_skip_threshold_mode3;
    uint32_t fast_skip_threshold_mode7;
    uint32_t mode45_channel0;
    uint32_t refine_iterations_channel;
    uint32_t channels;
};

void bc7_settings_to_gpu(const bc7_enc_settings& settings, bc7_gpu_settings* gpu);

inline size_t align_up(size_t size, size_t alignment)
{
    if (alignment == 0) return size;
    return (size + alignment - 1) / alignment * alignment;
}

// Work-groups of 8x8 blocks covering a width x height image.
inline uint32_t dispatch_group_count(uint32_t texels)
{
    uint32_t blocks = (texels + 3) / 4;
    return (blocks + 7) / 8;
}

// Buffer handles carry neither size nor usage, the caller restates both.
struct gpu_destination
{
    VkBuffer buffer;
    VkDeviceSize size;
    VkBufferUsageFlags usage;
};

// Batches BC7 compression work into a caller supplied command buffer.
//
// The source image view must be in VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL
// when the command buffer executes. Compressed blocks are written into the
// destination buffer at byte_offset, BytesPerRow(width) bytes per block row.
//
// Not thread safe; one owner records and recycles.
class GpuBlockCompressor
{
public:
    GpuBlockCompressor(VkPhysicalDevice physical_device, VkDevice device);
    ~GpuBlockCompressor();

    GpuBlockCompressor(const GpuBlockCompressor&) = delete;
    GpuBlockCompressor& operator=(const GpuBlockCompressor&) = delete;

    bc7_error init();

    bc7_error add_task(const bc7_enc_settings& settings, VkImageView image_view, uint32_t width, uint32_t height,
                       const gpu_destination& dst, uint32_t row_offset = 0, uint32_t byte_offset = 0);

    // Records uploads and dispatches for all queued tasks, then drains the queue.
    // The queue is drained on failure too; a failed batch must be re-added.
    bc7_error compress(VkCommandBuffer command_buffer);

    // Call once every command buffer recorded so far has finished executing.
    void recycle();

    size_t pending_tasks() const { return m_tasks.size(); }

    // Device-free checks add_task runs before queueing.
    static bc7_error validate_task(const bc7_enc_settings& settings, uint32_t width, uint32_t height,
                                   const gpu_destination& dst, uint32_t row_offset, uint32_t byte_offset);

private:
    struct task
    {
        compression_variant variant;
        bc7_gpu_settings settings;
        VkImageView image_view;
        VkBuffer buffer;
        uint32_t width;
        uint32_t height;
        uint32_t texture_y_offset;
        uint32_t buffer_offset;
        uint32_t uniform_offset;
        uint32_t setting_offset;
    };

    struct gpu_buffer
    {
        VkBuffer buffer = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        VkDeviceSize size = 0;
    };

    struct pipeline_entry
    {
        VkDescriptorSetLayout set_layout = VK_NULL_HANDLE;
        VkPipelineLayout layout = VK_NULL_HANDLE;
        VkPipeline pipeline = VK_NULL_HANDLE;
    };

    bc7_error create_pipeline(compression_variant variant, VkShaderModule module);
    bc7_error record_batch(VkCommandBuffer command_buffer);
    bc7_error create_buffer(gpu_buffer* out, VkDeviceSize size, VkBufferUsageFlags usage);
    void destroy_buffer(gpu_buffer& buffer);
    bc7_error grow_buffer(gpu_buffer* buffer, VkDeviceSize needed, VkBufferUsageFlags usage);
    bc7_error create_descriptor_pool();
    bc7_error allocate_descriptor_set(VkDescriptorSetLayout layout, VkDescriptorSet* set);
    bool find_memory_type(uint32_t type_bits, VkMemoryPropertyFlags flags, uint32_t* index) const;
    void upload(VkCommandBuffer command_buffer, VkBuffer buffer, const std::vector<uint8_t>& data);

    VkPhysicalDevice m_physical_device;
    VkDevice m_device;
    bool m_initialized;

    VkSampler m_sampler;
    std::map<compression_variant, pipeline_entry> m_pipelines;

    std::vector<VkDescriptorPool> m_descriptor_pools;
    size_t m_current_pool;

    gpu_buffer m_uniforms_buffer;
    gpu_buffer m_settings_buffer;
    std::vector<gpu_buffer> m_retired_buffers;

    size_t m_uniforms_aligned_size;
    size_t m_settings_aligned_size;

    std::vector<task> m_tasks;
    std::vector<uint8_t> m_scratch;
};

} // namespace bc7comp
