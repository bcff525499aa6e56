#pragma once
#include "Kernel.hpp"

/**
 * @brief KernelInspector: 专为测试和底层诊断设计的内核内部状态访问器
 */
class KernelInspector
{
private:
    const Kernel *_kernel;

public:
    explicit KernelInspector(const Kernel *k) : _kernel(k) {}

    const AppDirectory *get_app_directory() const { return _kernel->_app_directory; }
    const AppLoader *get_app_loader() const { return _kernel->_app_loader; }
    const KernelObjectBuilder *get_object_builder() const { return _kernel->_builder; }
    const BootInfo &get_boot_info() const { return _kernel->_boot_info; }

    // 静态分配器水位线
    size_t get_static_used_bytes() const
    {
        if (!_kernel->_static_allocator)
            return 0;
        return _kernel->_static_allocator->get_used_bytes();
    }
};
