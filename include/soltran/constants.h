/// \file constants.h
/// \brief Physical constants and unit conversions.

#ifndef CONSTANTS_H_
#define CONSTANTS_H_

/** Energy released by a single fission (MeV) */
#define ENERGY_PER_FISSION 180.

/** Conversion from MeV to J */
#define JOULES_PER_MEV 1.6022E-13

/** Conversion from atoms/barn-cm to atoms/cm^3 */
#define ATOMS_PER_BARN_CM 1.E24

/** Conversion from g to kg */
#define GRAMS_PER_KILOGRAM 1.E3

/** Standard atmospheric pressure (Pa) */
#define STANDARD_PRESSURE 101325.

/** Conversion from Celsius to Kelvin */
#define ZERO_CELSIUS 273.15

#endif  // CONSTANTS_H_
