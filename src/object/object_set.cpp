#include <object/object_set.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace lre {

ObjectId ObjectSet::add(std::unique_ptr<Object> object) {
	if (!object) {
		throw std::invalid_argument("Object pointer cannot be null");
	}
	objects_.push_back(std::move(object));
	return objects_.size() - 1;
}

Object &ObjectSet::get(ObjectId id) {
	if (id >= objects_.size()) {
		throw std::out_of_range("Unknown object id " + std::to_string(id));
	}
	return *objects_[id];
}

const Object &ObjectSet::get(ObjectId id) const {
	if (id >= objects_.size()) {
		throw std::out_of_range("Unknown object id " + std::to_string(id));
	}
	return *objects_[id];
}

std::size_t ObjectSet::size() const {
	return objects_.size();
}

bool ObjectSet::empty() const {
	return objects_.empty();
}

}
