#ifndef TALLY_VM_API_H
#define TALLY_VM_API_H

#if defined(_WIN32) || defined(__CYGWIN__)
#  if defined(TALLYVM_SHARED)
#    if defined(TALLYVM_BUILDING_DLL)
#      define TALLYVM_API __declspec(dllexport)
#    else
#      define TALLYVM_API __declspec(dllimport)
#    endif
#  else
#    define TALLYVM_API
#  endif
#else
#  if __GNUC__ >= 4
#    define TALLYVM_API __attribute__((visibility("default")))
#  else
#    define TALLYVM_API
#  endif
#endif

#endif // TALLY_VM_API_H
