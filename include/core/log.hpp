#pragma once
#include <iostream>

#ifndef DUEL_LOG_ENABLED
#define DUEL_LOG_ENABLED 1
#endif

#if DUEL_LOG_ENABLED
#define DUEL_LOG(expr)                                                         \
  do {                                                                         \
    std::cerr << expr;                                                         \
  } while (0)
#define DUEL_LOGLN(expr)                                                       \
  do {                                                                         \
    std::cerr << expr << '\n';                                                 \
  } while (0)
#else
#define DUEL_LOG(expr)                                                         \
  do {                                                                         \
  } while (0)
#define DUEL_LOGLN(expr)                                                       \
  do {                                                                         \
  } while (0)
#endif
