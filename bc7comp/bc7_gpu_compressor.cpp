#include "bc7_gpu_compressor.h"
#include "bc7comp_log.h"

#include "kernel_bc7_spv.h"

#include <algorithm>
#include <cstring>

namespace bc7comp {

static const uint32_t g_initial_task_capacity = 16;
static const VkDeviceSize g_max_update_size = 65536;
static const uint32_t g_sets_per_pool = 64;

#define BC7COMP_VK_CHECK(call) \
    do { \
        VkResult vk_result = (call); \
        if (vk_result != VK_SUCCESS) \
        { \
            BC7COMP_LOGE("%s failed with VkResult %d", #call, int(vk_result)); \
            return BC7_ERR_DEVICE; \
        } \
    } while (0)

void bc7_settings_to_gpu(const bc7_enc_settings& settings, bc7_gpu_settings* gpu)
{
    for (int i = 0; i < 8; i++)
    {
        gpu->refine_iterations[i] = uint32_t(settings.refineIterations[i]);
        gpu->mode_selection[i] = settings.mode_selection[i] ? 1 : 0;
    }

    gpu->skip_mode2 = settings.skip_mode2 ? 1 : 0;
    gpu->fast_skip_threshold_mode1 = uint32_t(settings.fastSkipTreshold_mode1);
    gpu->fast_skip_threshold_mode3 = uint32_t(settings.fastSkipTreshold_mode3);
    gpu->fast_skip_threshold_mode7 = uint32_t(settings.fastSkipTreshold_mode7);
    gpu->mode45_channel0 = uint32_t(settings.mode45_channel0);
    gpu->refine_iterations_channel = uint32_t(settings.refineIterations_channel);
    gpu->channels = uint32_t(settings.channels);
}

GpuBlockCompressor::GpuBlockCompressor(VkPhysicalDevice physical_device, VkDevice device)
    : m_physical_device(physical_device)
    , m_device(device)
    , m_initialized(false)
    , m_sampler(VK_NULL_HANDLE)
    , m_current_pool(0)
    , m_uniforms_aligned_size(0)
    , m_settings_aligned_size(0)
{
}

GpuBlockCompressor::~GpuBlockCompressor()
{
    if (m_device == VK_NULL_HANDLE) return;

    for (gpu_buffer& buffer : m_retired_buffers)
        destroy_buffer(buffer);
    destroy_buffer(m_uniforms_buffer);
    destroy_buffer(m_settings_buffer);

    for (VkDescriptorPool pool : m_descriptor_pools)
        vkDestroyDescriptorPool(m_device, pool, nullptr);

    for (auto& entry : m_pipelines)
    {
        vkDestroyPipeline(m_device, entry.second.pipeline, nullptr);
        vkDestroyPipelineLayout(m_device, entry.second.layout, nullptr);
        vkDestroyDescriptorSetLayout(m_device, entry.second.set_layout, nullptr);
    }

    if (m_sampler != VK_NULL_HANDLE)
        vkDestroySampler(m_device, m_sampler, nullptr);
}

bc7_error GpuBlockCompressor::init()
{
    if (m_initialized)
        return BC7_SUCCESS;

    if (m_physical_device == VK_NULL_HANDLE || m_device == VK_NULL_HANDLE)
        return BC7_ERR_BAD_PARAM;

    VkPhysicalDeviceProperties properties;
    vkGetPhysicalDeviceProperties(m_physical_device, &properties);

    m_uniforms_aligned_size = align_up(sizeof(bc7_gpu_uniforms), size_t(properties.limits.minUniformBufferOffsetAlignment));
    m_settings_aligned_size = align_up(sizeof(bc7_gpu_settings), size_t(properties.limits.minStorageBufferOffsetAlignment));

    VkSamplerCreateInfo sampler_info = {};
    sampler_info.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    sampler_info.magFilter = VK_FILTER_NEAREST;
    sampler_info.minFilter = VK_FILTER_NEAREST;
    sampler_info.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    sampler_info.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    sampler_info.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    sampler_info.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    sampler_info.maxLod = 0.0f;
    BC7COMP_VK_CHECK(vkCreateSampler(m_device, &sampler_info, nullptr, &m_sampler));

    VkShaderModuleCreateInfo module_info = {};
    module_info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    module_info.codeSize = sizeof(kernel_bc7_spv);
    module_info.pCode = kernel_bc7_spv;

    VkShaderModule module = VK_NULL_HANDLE;
    BC7COMP_VK_CHECK(vkCreateShaderModule(m_device, &module_info, nullptr, &module));

    bc7_error status = create_pipeline(BC7_VARIANT_BC7, module);
    vkDestroyShaderModule(m_device, module, nullptr);
    if (status != BC7_SUCCESS)
        return status;

    status = create_buffer(&m_uniforms_buffer, m_uniforms_aligned_size * g_initial_task_capacity,
                           VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT);
    if (status != BC7_SUCCESS)
        return status;

    status = create_buffer(&m_settings_buffer, m_settings_aligned_size * g_initial_task_capacity,
                           VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT);
    if (status != BC7_SUCCESS)
        return status;

    status = create_descriptor_pool();
    if (status != BC7_SUCCESS)
        return status;

    BC7COMP_LOGI("device compressor ready, uniform slot %zu bytes, settings slot %zu bytes",
                 m_uniforms_aligned_size, m_settings_aligned_size);

    m_initialized = true;
    return BC7_SUCCESS;
}

bc7_error GpuBlockCompressor::create_pipeline(compression_variant variant, VkShaderModule module)
{
    // owned by the map from here on, the destructor releases partial state
    pipeline_entry& entry = m_pipelines[variant];

    VkDescriptorSetLayoutBinding bindings[4] = {};

    bindings[0].binding = 0;
    bindings[0].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    bindings[0].descriptorCount = 1;
    bindings[0].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    bindings[0].pImmutableSamplers = &m_sampler;

    bindings[1].binding = 1;
    bindings[1].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    bindings[1].descriptorCount = 1;
    bindings[1].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

    bindings[2].binding = 2;
    bindings[2].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC;
    bindings[2].descriptorCount = 1;
    bindings[2].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

    bindings[3].binding = 3;
    bindings[3].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC;
    bindings[3].descriptorCount = 1;
    bindings[3].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

    VkDescriptorSetLayoutCreateInfo set_layout_info = {};
    set_layout_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    set_layout_info.bindingCount = 4;
    set_layout_info.pBindings = bindings;
    BC7COMP_VK_CHECK(vkCreateDescriptorSetLayout(m_device, &set_layout_info, nullptr, &entry.set_layout));

    VkPipelineLayoutCreateInfo layout_info = {};
    layout_info.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layout_info.setLayoutCount = 1;
    layout_info.pSetLayouts = &entry.set_layout;
    BC7COMP_VK_CHECK(vkCreatePipelineLayout(m_device, &layout_info, nullptr, &entry.layout));

    VkComputePipelineCreateInfo pipeline_info = {};
    pipeline_info.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    pipeline_info.stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    pipeline_info.stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    pipeline_info.stage.module = module;
    pipeline_info.stage.pName = "main";
    pipeline_info.layout = entry.layout;
    BC7COMP_VK_CHECK(vkCreateComputePipelines(m_device, VK_NULL_HANDLE, 1, &pipeline_info, nullptr, &entry.pipeline));

    return BC7_SUCCESS;
}

bool GpuBlockCompressor::find_memory_type(uint32_t type_bits, VkMemoryPropertyFlags flags, uint32_t* index) const
{
    VkPhysicalDeviceMemoryProperties memory_properties;
    vkGetPhysicalDeviceMemoryProperties(m_physical_device, &memory_properties);

    for (uint32_t i = 0; i < memory_properties.memoryTypeCount; i++)
    {
        if ((type_bits & (1u << i)) == 0) continue;
        if ((memory_properties.memoryTypes[i].propertyFlags & flags) != flags) continue;

        *index = i;
        return true;
    }

    return false;
}

bc7_error GpuBlockCompressor::create_buffer(gpu_buffer* out, VkDeviceSize size, VkBufferUsageFlags usage)
{
    gpu_buffer result;
    result.size = size;

    VkBufferCreateInfo buffer_info = {};
    buffer_info.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    buffer_info.size = size;
    buffer_info.usage = usage;
    buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    BC7COMP_VK_CHECK(vkCreateBuffer(m_device, &buffer_info, nullptr, &result.buffer));

    VkMemoryRequirements requirements;
    vkGetBufferMemoryRequirements(m_device, result.buffer, &requirements);

    uint32_t type_index = 0;
    if (!find_memory_type(requirements.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, &type_index) &&
        !find_memory_type(requirements.memoryTypeBits, 0, &type_index))
    {
        BC7COMP_LOGE("no memory type for a %llu byte buffer", (unsigned long long)size);
        vkDestroyBuffer(m_device, result.buffer, nullptr);
        return BC7_ERR_DEVICE;
    }

    VkMemoryAllocateInfo alloc_info = {};
    alloc_info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    alloc_info.allocationSize = requirements.size;
    alloc_info.memoryTypeIndex = type_index;

    VkResult vk_result = vkAllocateMemory(m_device, &alloc_info, nullptr, &result.memory);
    if (vk_result != VK_SUCCESS)
    {
        BC7COMP_LOGE("vkAllocateMemory failed with VkResult %d", int(vk_result));
        vkDestroyBuffer(m_device, result.buffer, nullptr);
        return BC7_ERR_DEVICE;
    }

    vk_result = vkBindBufferMemory(m_device, result.buffer, result.memory, 0);
    if (vk_result != VK_SUCCESS)
    {
        BC7COMP_LOGE("vkBindBufferMemory failed with VkResult %d", int(vk_result));
        destroy_buffer(result);
        return BC7_ERR_DEVICE;
    }

    *out = result;
    return BC7_SUCCESS;
}

void GpuBlockCompressor::destroy_buffer(gpu_buffer& buffer)
{
    if (buffer.buffer != VK_NULL_HANDLE)
        vkDestroyBuffer(m_device, buffer.buffer, nullptr);
    if (buffer.memory != VK_NULL_HANDLE)
        vkFreeMemory(m_device, buffer.memory, nullptr);

    buffer = gpu_buffer();
}

bc7_error GpuBlockCompressor::grow_buffer(gpu_buffer* buffer, VkDeviceSize needed, VkBufferUsageFlags usage)
{
    if (needed <= buffer->size)
        return BC7_SUCCESS;

    gpu_buffer grown;
    bc7_error status = create_buffer(&grown, needed, usage);
    if (status != BC7_SUCCESS)
        return status;

    BC7COMP_LOGD("buffer grown from %llu to %llu bytes", (unsigned long long)buffer->size, (unsigned long long)needed);

    // earlier command buffers may still read the old one
    m_retired_buffers.push_back(*buffer);
    *buffer = grown;
    return BC7_SUCCESS;
}

bc7_error GpuBlockCompressor::create_descriptor_pool()
{
    VkDescriptorPoolSize pool_sizes[4] = {
        { VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, g_sets_per_pool },
        { VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, g_sets_per_pool },
        { VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, g_sets_per_pool },
        { VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC, g_sets_per_pool },
    };

    VkDescriptorPoolCreateInfo pool_info = {};
    pool_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    pool_info.maxSets = g_sets_per_pool;
    pool_info.poolSizeCount = 4;
    pool_info.pPoolSizes = pool_sizes;

    VkDescriptorPool pool = VK_NULL_HANDLE;
    BC7COMP_VK_CHECK(vkCreateDescriptorPool(m_device, &pool_info, nullptr, &pool));

    m_descriptor_pools.push_back(pool);
    return BC7_SUCCESS;
}

bc7_error GpuBlockCompressor::allocate_descriptor_set(VkDescriptorSetLayout layout, VkDescriptorSet* set)
{
    VkDescriptorSetAllocateInfo alloc_info = {};
    alloc_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    alloc_info.descriptorSetCount = 1;
    alloc_info.pSetLayouts = &layout;

    for (;;)
    {
        if (m_current_pool == m_descriptor_pools.size())
        {
            bc7_error status = create_descriptor_pool();
            if (status != BC7_SUCCESS)
                return status;
        }

        alloc_info.descriptorPool = m_descriptor_pools[m_current_pool];
        VkResult vk_result = vkAllocateDescriptorSets(m_device, &alloc_info, set);
        if (vk_result == VK_SUCCESS)
            return BC7_SUCCESS;

        if (vk_result != VK_ERROR_OUT_OF_POOL_MEMORY && vk_result != VK_ERROR_FRAGMENTED_POOL)
        {
            BC7COMP_LOGE("vkAllocateDescriptorSets failed with VkResult %d", int(vk_result));
            return BC7_ERR_DEVICE;
        }

        m_current_pool++;
    }
}

bc7_error GpuBlockCompressor::validate_task(const bc7_enc_settings& settings, uint32_t width, uint32_t height,
                                            const gpu_destination& dst, uint32_t row_offset, uint32_t byte_offset)
{
    if (width % 4 != 0 || height % 4 != 0 || row_offset % 4 != 0)
    {
        BC7COMP_LOGW("task %ux%u at row %u is not aligned to 4", width, height, row_offset);
        return BC7_ERR_BAD_DIMENSIONS;
    }

    // blocks_offset is addressed in 32-bit words
    if (byte_offset % 4 != 0)
    {
        BC7COMP_LOGW("destination offset %u is not a multiple of 4", byte_offset);
        return BC7_ERR_BAD_PARAM;
    }

    if ((dst.usage & VK_BUFFER_USAGE_STORAGE_BUFFER_BIT) == 0)
    {
        BC7COMP_LOGW("destination buffer lacks VK_BUFFER_USAGE_STORAGE_BUFFER_BIT");
        return BC7_ERR_BAD_USAGE;
    }

    VkDeviceSize needed = VkDeviceSize(byte_offset) + BlocksByteSize(width, height);
    if (dst.size < needed)
    {
        BC7COMP_LOGW("destination holds %llu bytes, %llu required",
                     (unsigned long long)dst.size, (unsigned long long)needed);
        return BC7_ERR_BAD_BUFFER_SIZE;
    }

    bc7_error status = ValidateSettings(&settings);
    if (status != BC7_SUCCESS)
    {
        BC7COMP_LOGW("invalid settings: %s", bc7_get_error_string(status));
        return status;
    }

    return BC7_SUCCESS;
}

bc7_error GpuBlockCompressor::add_task(const bc7_enc_settings& settings, VkImageView image_view, uint32_t width, uint32_t height,
                                       const gpu_destination& dst, uint32_t row_offset, uint32_t byte_offset)
{
    if (!m_initialized)
        return BC7_ERR_NOT_INITIALIZED;

    if (image_view == VK_NULL_HANDLE || dst.buffer == VK_NULL_HANDLE)
        return BC7_ERR_BAD_PARAM;

    bc7_error status = validate_task(settings, width, height, dst, row_offset, byte_offset);
    if (status != BC7_SUCCESS)
        return status;

    task t;
    t.variant = BC7_VARIANT_BC7;
    bc7_settings_to_gpu(settings, &t.settings);
    t.image_view = image_view;
    t.buffer = dst.buffer;
    t.width = width;
    t.height = height;
    t.texture_y_offset = row_offset;
    t.buffer_offset = byte_offset;
    t.uniform_offset = 0;
    t.setting_offset = 0;

    m_tasks.push_back(t);
    return BC7_SUCCESS;
}

void GpuBlockCompressor::upload(VkCommandBuffer command_buffer, VkBuffer buffer, const std::vector<uint8_t>& data)
{
    VkDeviceSize size = data.size();
    for (VkDeviceSize offset = 0; offset < size; offset += g_max_update_size)
    {
        VkDeviceSize chunk = std::min(g_max_update_size, size - offset);
        vkCmdUpdateBuffer(command_buffer, buffer, offset, chunk, data.data() + offset);
    }
}

bc7_error GpuBlockCompressor::compress(VkCommandBuffer command_buffer)
{
    if (!m_initialized)
        return BC7_ERR_NOT_INITIALIZED;

    if (command_buffer == VK_NULL_HANDLE)
        return BC7_ERR_BAD_PARAM;

    if (m_tasks.empty())
        return BC7_SUCCESS;

    // a failed batch is dropped as well, nothing is left queued for the next one
    bc7_error status = record_batch(command_buffer);
    m_tasks.clear();
    return status;
}

bc7_error GpuBlockCompressor::record_batch(VkCommandBuffer command_buffer)
{
    bc7_error status = grow_buffer(&m_uniforms_buffer, m_uniforms_aligned_size * m_tasks.size(),
                                   VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT);
    if (status != BC7_SUCCESS)
        return status;

    status = grow_buffer(&m_settings_buffer, m_settings_aligned_size * m_tasks.size(),
                         VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT);
    if (status != BC7_SUCCESS)
        return status;

    // one descriptor set per task, written before anything is recorded
    std::vector<VkDescriptorSet> sets(m_tasks.size(), VK_NULL_HANDLE);
    for (size_t i = 0; i < m_tasks.size(); i++)
    {
        task& t = m_tasks[i];
        t.uniform_offset = uint32_t(i * m_uniforms_aligned_size);
        t.setting_offset = uint32_t(i * m_settings_aligned_size);

        status = allocate_descriptor_set(m_pipelines[t.variant].set_layout, &sets[i]);
        if (status != BC7_SUCCESS)
            return status;

        VkDescriptorImageInfo image_info = {};
        image_info.imageView = t.image_view;
        image_info.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

        VkDescriptorBufferInfo buffer_infos[3] = {};
        buffer_infos[0].buffer = t.buffer;
        buffer_infos[0].offset = 0;
        buffer_infos[0].range = VK_WHOLE_SIZE;
        buffer_infos[1].buffer = m_uniforms_buffer.buffer;
        buffer_infos[1].offset = 0;
        buffer_infos[1].range = sizeof(bc7_gpu_uniforms);
        buffer_infos[2].buffer = m_settings_buffer.buffer;
        buffer_infos[2].offset = 0;
        buffer_infos[2].range = sizeof(bc7_gpu_settings);

        VkWriteDescriptorSet writes[4] = {};
        for (uint32_t w = 0; w < 4; w++)
        {
            writes[w].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            writes[w].dstSet = sets[i];
            writes[w].dstBinding = w;
            writes[w].descriptorCount = 1;
        }
        writes[0].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        writes[0].pImageInfo = &image_info;
        writes[1].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        writes[1].pBufferInfo = &buffer_infos[0];
        writes[2].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC;
        writes[2].pBufferInfo = &buffer_infos[1];
        writes[3].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC;
        writes[3].pBufferInfo = &buffer_infos[2];

        vkUpdateDescriptorSets(m_device, 4, writes, 0, nullptr);
    }

    // wait for earlier batches to finish reading the shared buffers
    VkMemoryBarrier barrier = {};
    barrier.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
    barrier.srcAccessMask = VK_ACCESS_UNIFORM_READ_BIT | VK_ACCESS_SHADER_READ_BIT;
    barrier.dstAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
    vkCmdPipelineBarrier(command_buffer, VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT,
                         0, 1, &barrier, 0, nullptr, 0, nullptr);

    m_scratch.assign(m_uniforms_aligned_size * m_tasks.size(), 0);
    for (const task& t : m_tasks)
    {
        bc7_gpu_uniforms uniforms;
        uniforms.width = t.width;
        uniforms.height = t.height;
        uniforms.texture_y_offset = t.texture_y_offset;
        uniforms.blocks_offset = t.buffer_offset / 4;
        memcpy(&m_scratch[t.uniform_offset], &uniforms, sizeof(uniforms));
    }
    upload(command_buffer, m_uniforms_buffer.buffer, m_scratch);

    m_scratch.assign(m_settings_aligned_size * m_tasks.size(), 0);
    for (const task& t : m_tasks)
        memcpy(&m_scratch[t.setting_offset], &t.settings, sizeof(t.settings));
    upload(command_buffer, m_settings_buffer.buffer, m_scratch);

    barrier.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
    barrier.dstAccessMask = VK_ACCESS_UNIFORM_READ_BIT | VK_ACCESS_SHADER_READ_BIT;
    vkCmdPipelineBarrier(command_buffer, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT,
                         0, 1, &barrier, 0, nullptr, 0, nullptr);

    for (size_t i = 0; i < m_tasks.size(); i++)
    {
        const task& t = m_tasks[i];
        const pipeline_entry& entry = m_pipelines[t.variant];

        vkCmdBindPipeline(command_buffer, VK_PIPELINE_BIND_POINT_COMPUTE, entry.pipeline);

        uint32_t dynamic_offsets[2] = { t.uniform_offset, t.setting_offset };
        vkCmdBindDescriptorSets(command_buffer, VK_PIPELINE_BIND_POINT_COMPUTE, entry.layout,
                                0, 1, &sets[i], 2, dynamic_offsets);

        vkCmdDispatch(command_buffer, dispatch_group_count(t.width), dispatch_group_count(t.height), 1);
    }

    BC7COMP_LOGD("recorded %zu compression tasks", m_tasks.size());
    return BC7_SUCCESS;
}

void GpuBlockCompressor::recycle()
{
    if (!m_initialized) return;

    for (VkDescriptorPool pool : m_descriptor_pools)
    {
        // vkResetDescriptorPool always returns VK_SUCCESS
        vkResetDescriptorPool(m_device, pool, 0);
    }
    m_current_pool = 0;

    for (gpu_buffer& buffer : m_retired_buffers)
        destroy_buffer(buffer);
    m_retired_buffers.clear();
}

} // namespace bc7comp
