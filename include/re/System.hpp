#pragma once

#include <re/Backend.hpp>
#include <re/CollectionCache.hpp>
#include <re/ImageRegistry.hpp>
#include <re/Object.hpp>
#include <re/Pass.hpp>
#include <re/PipelineCache.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace re {

/**
 * @brief Drives an ordered list of passes into one command sequence per frame
 *
 * Frame protocol:
 * @code
 * system.start(destination);   // or start_window(window)
 * system.add_object(obj);      // any number, into the current pass
 * system.next_pass();          // advance, at most passes().size() - 1 times
 * auto done = system.finish(dependency);
 * @endcode
 *
 * Intermediate images are allocated at the destination's dimensions, reused
 * while the dimensions stay the same and reallocated when they change. The
 * image tagged output_tag is replaced by the destination every frame.
 */
class System {
public:
    using CustomImages = ImageRegistry::Map;

    /**
     * @throws FatalError if there are no passes, pass names repeat, a pass
     *         creates no images or not one per attachment, an input tag is
     *         produced by no earlier pass nor supplied, or no pass creates
     *         output_tag
     */
    System(Backend& backend, std::vector<Pass> passes, CustomImages custom_images, std::string output_tag);

    System(const System&) = delete;
    System& operator=(const System&) = delete;
    System(System&&) noexcept = default;
    System& operator=(System&&) noexcept = default;

    /**
     * @brief Begin a frame rendering into destination, opening the first pass
     *
     * @throws FatalError if a frame is already being recorded
     */
    void start(const ImageHandle& destination);

    /**
     * @brief Begin a frame on the target's next image
     *
     * @return false if the target was stale and rebuilt; nothing was started
     */
    [[nodiscard]] bool start_window(SwapchainTarget& target);

    /**
     * @brief Record a draw of object into the current pass
     *
     * @throws FatalError outside a frame, or if the pipeline or the pass
     *         inputs cannot be built
     */
    void add_object(Drawcall& object);

    /**
     * @brief Close the current pass and open the next one
     *
     * @throws FatalError outside a frame or when already at the last pass
     */
    void next_pass();

    /**
     * @brief Close the current pass and submit the frame
     *
     * @param dependency Signal the submission waits on, may be null
     * @throws FatalError outside a frame
     */
    [[nodiscard]] CompletionSignalHandle finish(const CompletionSignalHandle& dependency);

    /// finish() waiting on the target's acquire, then present. False if the target went stale.
    bool finish_to_window(SwapchainTarget& target);

    /// Takes effect on the next start().
    void set_output_tag(std::string tag);
    [[nodiscard]] const std::string& output_tag() const { return m_output_tag; }

    [[nodiscard]] bool is_recording() const;
    /// Index of the open pass while recording.
    [[nodiscard]] std::optional<std::size_t> current_pass() const;
    [[nodiscard]] const std::vector<Pass>& passes() const { return m_passes; }
    /// Images bound by the latest start().
    [[nodiscard]] const ImageRegistry& images() const { return m_registry; }

    [[nodiscard]] PipelineCache& pipeline_cache(std::size_t pass_index) { return m_pipeline_caches.at(pass_index); }
    [[nodiscard]] CollectionCache& collection_cache(std::size_t pass_index) { return m_collection_caches.at(pass_index); }
    /// First slot available to an object's own sets in pass_index.
    [[nodiscard]] uint32_t object_slot_offset(std::size_t pass_index) const;

    void print_stats() const;

private:
    struct Idle {};
    struct Recording {
        CommandSequenceHandle sequence;
        std::size_t pass_index = 0;
        std::vector<FramebufferHandle> framebuffers;
        vk::Extent2D dimensions;
    };

    /// Auto-allocated images and the dimensions they were allocated at.
    struct ImageSet {
        vk::Extent2D dimensions;
        std::string output_tag;
        ImageRegistry::Map images;
    };

    void validate() const;
    Recording& recording(std::string_view stage);
    void ensure_images(vk::Extent2D dimensions);
    void bind_images(const ImageHandle& destination);
    [[nodiscard]] bool output_is_sampled() const;

    Backend* m_backend;
    std::vector<Pass> m_passes;
    CustomImages m_custom_images;
    std::string m_output_tag;

    std::vector<PipelineCache> m_pipeline_caches;
    std::vector<CollectionCache> m_collection_caches;

    std::optional<ImageSet> m_image_set;
    ImageRegistry m_registry;
    std::weak_ptr<Image> m_last_destination;
    uint64_t m_generation = 0;

    std::variant<Idle, Recording> m_state;
};

} // namespace re
