#pragma once

template<class ErrT, typename V>
class Response {
public:
    explicit inline Response(ErrT error) : isError{true}, error{error}, value{} {}
    explicit inline Response(V value) : isError{false}, error{}, value{value} {}

    inline bool CheckError() const {
        return isError;
    }

    inline ErrT GetError() const {
        return error;
    }

    inline V GetValue() const {
        return value;
    }

private:
    bool isError;
    [[maybe_unused]] ErrT error;
    [[maybe_unused]] V value;
};

// operations that either fail with an error or complete without producing a value
template<class ErrT>
class Response<ErrT, void> {
public:
    explicit inline Response() : isError{false}, error{} {}
    explicit inline Response(ErrT error) : isError{true}, error{error} {}

    static inline Response MakeSuccess() { return Response(); }

    inline bool CheckError() const {
        return isError;
    }

    inline ErrT GetError() const {
        return error;
    }

private:
    bool isError;
    [[maybe_unused]] ErrT error;
};

template<typename T>
class Optional {
public:
    explicit inline Optional() : hasValue{false}, value{} {}
    explicit inline Optional(T value) : hasValue{true}, value{value} {}

    inline bool HasValue() const {
        return hasValue;
    }

    inline T GetValue() const {
        return value;
    }

private:
    bool hasValue;
    [[maybe_unused]] T value;
};
