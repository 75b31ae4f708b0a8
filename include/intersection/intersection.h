#ifndef LRE_INCLUDE_INTERSECTION_INTERSECTION_H
#define LRE_INCLUDE_INTERSECTION_INTERSECTION_H

#include <cstddef>
#include <initializer_list>
#include <object/object_set.h>
#include <vector>

namespace lre {

// A t-value together with the handle of the object it belongs to.
struct Intersection {
	double t;
	ObjectId object;

	Intersection(double t, ObjectId object);
};

// Intersections of one ray, always kept in ascending order of t.
class Intersections {
public:
	using const_iterator = std::vector<Intersection>::const_iterator;

	Intersections() = default;
	Intersections(std::initializer_list<Intersection> items);

	// Pair every t-value with the same object, sorted.
	static Intersections create(const TValues &ts, ObjectId object);

	// Collect intersections into one sorted list.
	static Intersections combine(const std::vector<Intersection> &items);

	// Append without sorting. Call sort() afterwards.
	void append(const Intersection &item);
	void append(const TValues &ts, ObjectId object);

	// Stable sort by t, NaN values go last.
	void sort();

	// Whether one of the t-values equals t within EPSILON.
	bool contains(double t) const;

	// The first intersection with the smallest non-negative t, or nullptr.
	const Intersection *hit() const;

	std::size_t size() const;
	bool empty() const;
	const Intersection &operator[](std::size_t i) const;
	const_iterator begin() const;
	const_iterator end() const;

private:
	std::vector<Intersection> items_;
};

}

#endif
