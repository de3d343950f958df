#ifndef RENDERENGINE_COLLECTION_HPP
#define RENDERENGINE_COLLECTION_HPP

#include <re/Backend.hpp>
#include <re/Binding.hpp>
#include <re/Error.hpp>
#include <cstring>
#include <type_traits>
#include <vector>

namespace re
{

inline constexpr std::size_t MAX_BINDINGS_PER_SET = 3;
inline constexpr std::size_t MAX_SETS_PER_COLLECTION = 4;

/**
 * @brief Ordered, mutable list of the bindings of one binding set
 *
 * Binding i ends up at binding index i of the set's slot.
 */
class SetData
{
public:
	SetData() = default;

	template<typename T>
	SetData& add_uniform(const T& value)
	{
		static_assert(std::is_trivially_copyable_v<T>, "uniform data must be trivially copyable");
		check_room();
		UniformBinding binding;
		binding.bytes.resize(sizeof(T));
		std::memcpy(binding.bytes.data(), &value, sizeof(T));
		m_bindings.emplace_back(std::move(binding));
		return *this;
	}

	SetData& add_image(ImageHandle image);

	/// Overwrite uniform at index. The value must have the size it was added with.
	template<typename T>
	void write_uniform(std::size_t index, const T& value)
	{
		static_assert(std::is_trivially_copyable_v<T>, "uniform data must be trivially copyable");
		auto& bytes = uniform_bytes(index, sizeof(T));
		std::memcpy(bytes.data(), &value, sizeof(T));
	}

	template<typename T>
	[[nodiscard]] T read_uniform(std::size_t index) const
	{
		static_assert(std::is_trivially_copyable_v<T>, "uniform data must be trivially copyable");
		T value;
		std::memcpy(&value, uniform_bytes(index, sizeof(T)).data(), sizeof(T));
		return value;
	}

	void replace_image(std::size_t index, ImageHandle image);

	[[nodiscard]] const std::vector<Binding>& bindings() const { return m_bindings; }
	[[nodiscard]] std::size_t size() const { return m_bindings.size(); }
	[[nodiscard]] bool empty() const { return m_bindings.empty(); }

private:
	void check_room() const;
	std::vector<std::byte>& uniform_bytes(std::size_t index, std::size_t size);
	[[nodiscard]] const std::vector<std::byte>& uniform_bytes(std::size_t index, std::size_t size) const;

	std::vector<Binding> m_bindings;
};

/**
 * @brief SetData plus the backend binding set built from it
 *
 * Edits to data() are not visible through get() until upload() is called.
 */
class Set
{
public:
	Set(SetData data, Backend& backend, PipelineHandle pipeline, uint32_t slot);

	[[nodiscard]] SetData& data() { return m_data; }
	[[nodiscard]] const SetData& data() const { return m_data; }

	/// Rebuild the binding set from the current data.
	void upload(Backend& backend);

	/// Rebuild from the last uploaded data for a different pipeline or slot.
	void rebind(Backend& backend, PipelineHandle pipeline, uint32_t slot);

	[[nodiscard]] const BindingSetHandle& get() const { return m_handle; }
	[[nodiscard]] const PipelineHandle& pipeline() const { return m_pipeline; }
	[[nodiscard]] uint32_t slot() const { return m_slot; }

private:
	void build(Backend& backend, const std::vector<Binding>& bindings);

	SetData m_data;
	std::vector<Binding> m_uploaded;
	PipelineHandle m_pipeline;
	uint32_t m_slot;
	BindingSetHandle m_handle;
};

/// Ordered Sets occupying consecutive slots starting at a base slot.
class Collection
{
public:
	Collection() = default;
	Collection(Backend& backend, const PipelineHandle& pipeline, std::vector<SetData> sets, uint32_t first_slot = 0);

	/// Binding handles in slot order.
	[[nodiscard]] std::vector<BindingSetHandle> get() const;

	/**
	 * @brief Handles valid for pipeline with the first set at first_slot
	 *
	 * Sets built for another pipeline or slot are rebound from their last
	 * uploaded data.
	 */
	[[nodiscard]] std::vector<BindingSetHandle> resolve(Backend& backend, const PipelineHandle& pipeline, uint32_t first_slot);

	void upload(Backend& backend);

	[[nodiscard]] Set& set(std::size_t index) { return m_sets.at(index); }
	[[nodiscard]] const Set& set(std::size_t index) const { return m_sets.at(index); }
	[[nodiscard]] std::size_t size() const { return m_sets.size(); }
	[[nodiscard]] bool empty() const { return m_sets.empty(); }

private:
	std::vector<Set> m_sets;
};

} // namespace re

#endif // RENDERENGINE_COLLECTION_HPP
