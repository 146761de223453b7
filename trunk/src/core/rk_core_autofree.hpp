//
// Copyright (c) 2013-2023 The SRS Authors
//
// SPDX-License-Identifier: MIT or MulanPSL-2.0
//

#ifndef RK_CORE_AUTO_FREE_HPP
#define RK_CORE_AUTO_FREE_HPP

#include <rk_core.hpp>

#include <stdlib.h>

// The auto free helper, which is actually the unique ptr, without the move feature.
//
// To free the instance in the current scope, for instance, MyClass* ptr,
// which is a ptr and this class will:
//       1. free the ptr.
//       2. set ptr to NULL.
//
// Usage:
//       MyClass* po = new MyClass();
//       // ...... use po
//       RkAutoFree(MyClass, po);
//
// Usage for array:
//      MyClass** pa = new MyClass*[size];
//      // ....... use pa
//      RkAutoFreeA(MyClass*, pa);
//
// @remark the MyClass can be basic type, for instance, RkAutoFreeA(char, pstr),
//      where the char* pstr = new char[size].
// To delete object.
#define RkAutoFree(className, instance) \
    impl_RkAutoFree<className> _auto_free_##instance(&instance, false, false)
// To delete array.
#define RkAutoFreeA(className, instance) \
    impl_RkAutoFree<className> _auto_free_array_##instance(&instance, true, false)
// Use free instead of delete.
#define RkAutoFreeF(className, instance) \
    impl_RkAutoFree<className> _auto_free_##instance(&instance, false, true)
// The template implementation.
template<class T>
class impl_RkAutoFree
{
private:
    T** ptr;
    bool is_array;
    bool _use_free;
public:
    // If use_free, use free(void*) to release the p.
    // Use delete to release p, or delete[] if p is an array.
    impl_RkAutoFree(T** p, bool array, bool use_free) {
        ptr = p;
        is_array = array;
        _use_free = use_free;
    }

    virtual ~impl_RkAutoFree() {
        if (ptr == NULL || *ptr == NULL) {
            return;
        }

        if (_use_free) {
            free(*ptr);
        } else {
            if (is_array) {
                delete[] *ptr;
            } else {
                delete *ptr;
            }
        }

        *ptr = NULL;
    }
};

#endif
