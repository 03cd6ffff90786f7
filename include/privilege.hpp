#pragma once

class PrivilegeGate {
public:
    virtual ~PrivilegeGate() = default;
    virtual bool IsElevated() const = 0;
};

// Asks the OS about the current process token
class SystemPrivilegeGate : public PrivilegeGate {
public:
    bool IsElevated() const override;
};
