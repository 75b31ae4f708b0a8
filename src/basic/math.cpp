#include <basic/math.h>
#include <cmath>

namespace lre {

bool feq(double a, double b) {
	return std::fabs(a - b) < EPSILON;
}

}
