#ifndef LRE_INCLUDE_BASIC_ERROR_H
#define LRE_INCLUDE_BASIC_ERROR_H

#include <stdexcept>
#include <string>

namespace lre {

// Thrown when a matrix (or a transformation built from it) has no inverse.
class NonInvertibleMatrix : public std::runtime_error {
public:
	explicit NonInvertibleMatrix(const std::string &what) : std::runtime_error(what) {
	}
};

// Thrown when a shadow test or a shade is requested from a world that does not hold exactly one light.
class UnsupportedLightCount : public std::runtime_error {
public:
	UnsupportedLightCount(const std::string &what, std::size_t count) : std::runtime_error(what), count_(count) {
	}

	std::size_t count() const {
		return count_;
	}

private:
	std::size_t count_;
};

// Thrown on a pixel access outside the canvas.
class CanvasOutOfBounds : public std::out_of_range {
public:
	explicit CanvasOutOfBounds(const std::string &what) : std::out_of_range(what) {
	}
};

// Thrown when dividing by a near-zero quantity.
class DivisionByZero : public std::domain_error {
public:
	explicit DivisionByZero(const std::string &what) : std::domain_error(what) {
	}
};

// Thrown when an object does not provide the requested capability.
class UnsupportedOperation : public std::logic_error {
public:
	explicit UnsupportedOperation(const std::string &what) : std::logic_error(what) {
	}
};

}

#endif
