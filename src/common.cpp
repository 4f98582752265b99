#include "common.hpp"

namespace saftbar {

bool verbose = false;

}
