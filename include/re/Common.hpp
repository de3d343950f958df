#ifndef RENDERENGINE_COMMON_HPP
#define RENDERENGINE_COMMON_HPP
#include <fmt/format.h>
#include <vulkan/vulkan.hpp>
#include <string_view>
#include <utility>

template<class... Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};

template<class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

#define CHECK_VK_RESULT(res, msg) \
if (res.result != vk::Result::eSuccess) \
{ \
	return std::unexpected(fmt::format(msg, vk::to_string(res.result))); \
}

#define CHECK_VK_RESULT_VOID(res, msg) \
if (res != vk::Result::eSuccess) \
{ \
	return std::unexpected(fmt::format(msg, vk::to_string(res))); \
}

#endif // RENDERENGINE_COMMON_HPP
