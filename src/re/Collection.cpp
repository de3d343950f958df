#include <re/Collection.hpp>
#include <re/Logger.hpp>
#include <utility>

namespace re
{

SetData& SetData::add_image(ImageHandle image)
{
	check_room();
	if (!image)
	{
		fatal("set data", "", "null image added to a set");
	}
	m_bindings.emplace_back(ImageBinding{std::move(image)});
	return *this;
}

void SetData::replace_image(std::size_t index, ImageHandle image)
{
	if (index >= m_bindings.size() || !std::holds_alternative<ImageBinding>(m_bindings[index]))
	{
		fatal("set data", "", fmt::format("binding {} is not an image", index));
	}
	std::get<ImageBinding>(m_bindings[index]).image = std::move(image);
}

void SetData::check_room() const
{
	if (m_bindings.size() >= MAX_BINDINGS_PER_SET)
	{
		fatal("set data", "", fmt::format("a set holds at most {} bindings", MAX_BINDINGS_PER_SET));
	}
}

std::vector<std::byte>& SetData::uniform_bytes(std::size_t index, std::size_t size)
{
	return const_cast<std::vector<std::byte>&>(std::as_const(*this).uniform_bytes(index, size));
}

const std::vector<std::byte>& SetData::uniform_bytes(std::size_t index, std::size_t size) const
{
	if (index >= m_bindings.size())
	{
		fatal("set data", "", fmt::format("binding {} out of range, set has {}", index, m_bindings.size()));
	}
	const auto* uniform = std::get_if<UniformBinding>(&m_bindings[index]);
	if (!uniform)
	{
		fatal("set data", "", fmt::format("binding {} is not a uniform", index));
	}
	if (uniform->bytes.size() != size)
	{
		fatal("set data", "",
			  fmt::format("binding {} holds {} bytes, accessed as {}", index, uniform->bytes.size(), size));
	}
	return uniform->bytes;
}

Set::Set(SetData data, Backend& backend, PipelineHandle pipeline, uint32_t slot)
	: m_data(std::move(data))
	, m_pipeline(std::move(pipeline))
	, m_slot(slot)
{
	upload(backend);
}

void Set::upload(Backend& backend)
{
	build(backend, m_data.bindings());
	m_uploaded = m_data.bindings();
}

void Set::rebind(Backend& backend, PipelineHandle pipeline, uint32_t slot)
{
	m_pipeline = std::move(pipeline);
	m_slot = slot;
	build(backend, m_uploaded);
}

void Set::build(Backend& backend, const std::vector<Binding>& bindings)
{
	auto handle = backend.create_binding_set(m_pipeline, m_slot, bindings);
	if (!handle)
	{
		fatal("set data", "", fmt::format("binding set for slot {}: {}", m_slot, handle.error()));
	}
	m_handle = std::move(*handle);
}

Collection::Collection(Backend& backend, const PipelineHandle& pipeline, std::vector<SetData> sets, uint32_t first_slot)
{
	if (sets.size() > MAX_SETS_PER_COLLECTION)
	{
		fatal("set data", "",
			  fmt::format("{} sets given, a collection holds at most {}", sets.size(), MAX_SETS_PER_COLLECTION));
	}
	m_sets.reserve(sets.size());
	for (std::size_t i = 0; i < sets.size(); i++)
	{
		m_sets.emplace_back(std::move(sets[i]), backend, pipeline, first_slot + static_cast<uint32_t>(i));
	}
}

std::vector<BindingSetHandle> Collection::get() const
{
	std::vector<BindingSetHandle> handles;
	handles.reserve(m_sets.size());
	for (const auto& set : m_sets)
	{
		handles.push_back(set.get());
	}
	return handles;
}

std::vector<BindingSetHandle> Collection::resolve(Backend& backend, const PipelineHandle& pipeline, uint32_t first_slot)
{
	for (std::size_t i = 0; i < m_sets.size(); i++)
	{
		auto& set = m_sets[i];
		auto slot = first_slot + static_cast<uint32_t>(i);
		if (set.pipeline() != pipeline || set.slot() != slot)
		{
			Logger::instance().trace("Rebinding set {} to slot {}", i, slot);
			set.rebind(backend, pipeline, slot);
		}
	}
	return get();
}

void Collection::upload(Backend& backend)
{
	for (auto& set : m_sets)
	{
		set.upload(backend);
	}
}

} // namespace re
