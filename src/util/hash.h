#ifndef PLANCOMP_HASH_H
#define PLANCOMP_HASH_H

#include <cstddef>
#include <robin_hood.h>

template <class T>
inline void hash_combine(std::size_t & s, const T & v)
{
  static robin_hood::hash<T> h;
  s ^= h(v) + 0x9e3779b9 + (s<< 6) + (s>> 2);
}

#endif
