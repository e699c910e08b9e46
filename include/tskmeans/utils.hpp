#ifndef TSKMEANS_UTILS_HPP
#define TSKMEANS_UTILS_HPP

#include <type_traits>

namespace tskmeans {

template<typename Input_>
using I = typename std::remove_cv<typename std::remove_reference<Input_>::type>::type;

}

#endif
