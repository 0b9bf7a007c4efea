// Copyright Global Phasing Ltd.

#ifndef ENSFIT_VERSION_HPP_
#define ENSFIT_VERSION_HPP_
#define ENSFIT_VERSION "0.3.0"
#endif
