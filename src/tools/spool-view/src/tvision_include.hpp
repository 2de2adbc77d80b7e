#pragma once

#define Uses_TApplication
#define Uses_TButton
#define Uses_TClipboard
#define Uses_TCommandSet
#define Uses_TDeskTop
#define Uses_TDrawBuffer
#define Uses_TEvent
#define Uses_TFrame
#define Uses_TGroup
#define Uses_TKeys
#define Uses_TListViewer
#define Uses_TMenu
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TPalette
#define Uses_TProgram
#define Uses_TRect
#define Uses_TScrollBar
#define Uses_TScroller
#define Uses_TStaticText
#define Uses_TStatusDef
#define Uses_TStatusItem
#define Uses_TStatusLine
#define Uses_TSubMenu
#define Uses_TView
#define Uses_TWindow
#define Uses_MsgBox
#include <tvision/tv.h>
