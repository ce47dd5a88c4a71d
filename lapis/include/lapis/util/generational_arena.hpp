#pragma once
#include <lapis/util/ptr.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace lapis {
///
/// \brief Strongly-typed (index, generation) handle into a GenerationalArena.
///
/// A handle whose slot was freed (and possibly reused) never resolves again.
///
template <typename Tag>
struct GenerationalId {
	static constexpr auto null_v = std::numeric_limits<std::uint32_t>::max();

	std::uint32_t index{null_v};
	std::uint32_t generation{};

	constexpr bool is_null() const { return index == null_v; }

	bool operator==(GenerationalId const&) const = default;

	struct Hasher {
		std::size_t operator()(GenerationalId const id) const {
			return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(id.generation) << 32) | id.index);
		}
	};
};

template <typename Type, typename IdType>
class GenerationalArena {
  public:
	using id_type = IdType;

	std::pair<IdType, Type&> insert(Type t) {
		auto index = std::uint32_t{};
		if (!m_free.empty()) {
			index = m_free.back();
			m_free.pop_back();
		} else {
			index = static_cast<std::uint32_t>(m_slots.size());
			m_slots.emplace_back();
		}
		auto& slot = m_slots[index];
		slot.value.emplace(std::move(t));
		++m_size;
		return {IdType{index, slot.generation}, *slot.value};
	}

	///
	/// \brief Remove the value for id and bump its slot's generation.
	/// \returns The removed value, if id was live
	///
	std::optional<Type> remove(IdType const id) {
		auto* slot = live_slot(id);
		if (!slot) { return {}; }
		auto ret = std::optional<Type>{std::move(*slot->value)};
		slot->value.reset();
		++slot->generation;
		m_free.push_back(id.index);
		--m_size;
		return ret;
	}

	bool contains(IdType const id) const { return find(id) != nullptr; }

	Ptr<Type const> find(IdType const id) const {
		if (id.is_null() || id.index >= m_slots.size()) { return {}; }
		auto const& slot = m_slots[id.index];
		if (slot.generation != id.generation || !slot.value) { return {}; }
		return &*slot.value;
	}

	Ptr<Type> find(IdType const id) { return const_cast<Type*>(std::as_const(*this).find(id)); }

	///
	/// \brief Invoke func(IdType, Type&) for each live value.
	///
	template <typename Func>
	void for_each(Func&& func) {
		for (std::uint32_t index = 0; index < m_slots.size(); ++index) {
			auto& slot = m_slots[index];
			if (slot.value) { func(IdType{index, slot.generation}, *slot.value); }
		}
	}

	template <typename Func>
	void for_each(Func&& func) const {
		for (std::uint32_t index = 0; index < m_slots.size(); ++index) {
			auto const& slot = m_slots[index];
			if (slot.value) { func(IdType{index, slot.generation}, *slot.value); }
		}
	}

	std::vector<IdType> ids() const {
		auto ret = std::vector<IdType>{};
		ret.reserve(m_size);
		for_each([&ret](IdType const id, Type const&) { ret.push_back(id); });
		return ret;
	}

	std::size_t size() const { return m_size; }
	bool empty() const { return m_size == 0; }

  private:
	struct Slot {
		std::optional<Type> value{};
		std::uint32_t generation{};
	};

	Ptr<Slot> live_slot(IdType const id) {
		if (id.is_null() || id.index >= m_slots.size()) { return {}; }
		auto& slot = m_slots[id.index];
		if (slot.generation != id.generation || !slot.value) { return {}; }
		return &slot;
	}

	std::vector<Slot> m_slots{};
	std::vector<std::uint32_t> m_free{};
	std::size_t m_size{};
};
} // namespace lapis
