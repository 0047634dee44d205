export module Runtime;

export import :Engine;
