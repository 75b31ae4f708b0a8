#ifndef LRE_INCLUDE_OBJECT_OBJECT_SET_H
#define LRE_INCLUDE_OBJECT_OBJECT_SET_H

#include <cstddef>
#include <memory>
#include <object/object.h>
#include <vector>

namespace lre {

// Stable handle of an object inside an ObjectSet
using ObjectId = std::size_t;

// Unified container for all objects. Owns them; everything else refers to them by ObjectId,
// and handles stay valid for the lifetime of the set.
class ObjectSet {
public:
	ObjectSet() = default;

	ObjectSet(const ObjectSet &) = delete;
	ObjectSet &operator=(const ObjectSet &) = delete;
	ObjectSet(ObjectSet &&) = default;
	ObjectSet &operator=(ObjectSet &&) = default;

	// Takes ownership and returns the handle of the new object.
	ObjectId add(std::unique_ptr<Object> object);

	// Throws std::out_of_range for an unknown handle.
	Object &get(ObjectId id);
	const Object &get(ObjectId id) const;

	// Typed access, throws std::bad_cast if the object is of another type.
	template <typename T>
	T &get_as(ObjectId id) {
		return dynamic_cast<T &>(get(id));
	}

	std::size_t size() const;
	bool empty() const;

private:
	std::vector<std::unique_ptr<Object>> objects_;
};

}

#endif
