#include <algorithm>
#include <basic/math.h>
#include <cmath>
#include <intersection/intersection.h>

namespace lre {

namespace {

// Strict weak ordering on t that never traps on NaN: NaN compares after every number.
bool earlier(const Intersection &a, const Intersection &b) {
	if (std::isnan(a.t)) {
		return false;
	}
	if (std::isnan(b.t)) {
		return true;
	}
	return a.t < b.t;
}

}

Intersection::Intersection(double t, ObjectId object) : t(t), object(object) {
}

Intersections::Intersections(std::initializer_list<Intersection> items) : items_(items) {
	sort();
}

Intersections Intersections::create(const TValues &ts, ObjectId object) {
	Intersections res;
	res.append(ts, object);
	res.sort();
	return res;
}

Intersections Intersections::combine(const std::vector<Intersection> &items) {
	Intersections res;
	res.items_ = items;
	res.sort();
	return res;
}

void Intersections::append(const Intersection &item) {
	items_.push_back(item);
}

void Intersections::append(const TValues &ts, ObjectId object) {
	items_.reserve(items_.size() + ts.size());
	for (double t : ts) {
		items_.emplace_back(t, object);
	}
}

void Intersections::sort() {
	std::stable_sort(items_.begin(), items_.end(), earlier);
}

bool Intersections::contains(double t) const {
	return std::any_of(items_.begin(), items_.end(), [t](const Intersection &i) { return feq(i.t, t); });
}

const Intersection *Intersections::hit() const {
	for (const Intersection &i : items_) {
		// Negative and NaN t-values are never visible
		if (!(i.t >= 0.0)) {
			continue;
		}
		return &i;
	}
	return nullptr;
}

std::size_t Intersections::size() const {
	return items_.size();
}

bool Intersections::empty() const {
	return items_.empty();
}

const Intersection &Intersections::operator[](std::size_t i) const {
	return items_.at(i);
}

Intersections::const_iterator Intersections::begin() const {
	return items_.begin();
}

Intersections::const_iterator Intersections::end() const {
	return items_.end();
}

}
