#pragma once

#include "Error.h"

// Runs f and returns the code of the CMCMError it throws, or MCMERR_OK.
template <typename F>
int ThrownCode(F f)
{
   try
   {
      f();
   }
   catch (const CMCMError& e)
   {
      return e.getCode();
   }
   return MCMERR_OK;
}
