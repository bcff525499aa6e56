#pragma once

/**
 * @brief 平台抽象集合
 * 在 kmain 启动时，由平台层填充并注入给内核；未提供的钩子置 nullptr
 */
struct PlatformHooks
{
    const char *platform_name;

    // 应用字节写入槽位之后、跳转执行之前调用（RISC-V 上对应 fence.i）
    void (*flush_icache)();
};
