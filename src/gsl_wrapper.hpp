#ifndef SPVD_GSL_WRAPPER_HPP
#define SPVD_GSL_WRAPPER_HPP
#pragma once

#if __clang__
#pragma clang diagnostic push
#if __clang_major__ < 6
#pragma clang diagnostic ignored "-Wunknown-attributes"
#endif
#endif

#include <gsl/narrow>
#include <gsl/span>
#include <gsl/util>

#if __clang__
#pragma clang diagnostic pop
#endif

#endif
